#pragma once

/**
 * FakeClock.hpp
 *
 * Clock whose waits return at once. Time still moves forward with the real
 * steady clock, plus every skipped wait.
 */

#include "core/Clock.hpp"

#include <mutex>
#include <vector>

namespace modelfetch::test {

class FakeClock : public core::Clock {
public:
    TimePoint now() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::chrono::steady_clock::now() + m_offset;
    }

    bool waitUntil(TimePoint deadline, const std::function<bool()>& interrupted) override {
        if (interrupted && interrupted()) {
            return false;
        }

        auto current = now();
        std::lock_guard<std::mutex> lock(m_mutex);
        Duration skipped = deadline > current ? deadline - current : Duration::zero();
        m_offset += skipped;
        m_waits.push_back(skipped);
        return true;
    }

    /**
     * Lengths of every wait so far
     */
    std::vector<Duration> waits() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_waits;
    }

private:
    mutable std::mutex m_mutex;
    Duration m_offset{0};
    std::vector<Duration> m_waits;
};

} // namespace modelfetch::test

#pragma once

/**
 * Clock.hpp
 *
 * Time source used for retry backoff, progress throttling and durations.
 * Injected so that waits can be skipped in tests.
 */

#include <chrono>
#include <functional>
#include <thread>
#include <algorithm>

namespace modelfetch::core {

class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;

    /**
     * Block until the deadline or until interrupted() turns true.
     * @return false if interrupted before the deadline
     */
    virtual bool waitUntil(TimePoint deadline, const std::function<bool()>& interrupted) = 0;

    /**
     * Process-wide steady clock
     */
    static Clock& system();
};

/**
 * SystemClock - steady_clock with sliced sleeps so a pause or cancel
 * never waits out a full retry delay.
 */
class SystemClock : public Clock {
public:
    TimePoint now() const override {
        return std::chrono::steady_clock::now();
    }

    bool waitUntil(TimePoint deadline, const std::function<bool()>& interrupted) override {
        constexpr auto slice = std::chrono::milliseconds(25);
        while (true) {
            if (interrupted && interrupted()) {
                return false;
            }
            auto current = now();
            if (current >= deadline) {
                return true;
            }
            std::this_thread::sleep_for(std::min<Duration>(deadline - current, slice));
        }
    }
};

inline Clock& Clock::system() {
    static SystemClock instance;
    return instance;
}

} // namespace modelfetch::core

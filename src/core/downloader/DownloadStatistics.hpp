#pragma once

/**
 * DownloadStatistics.hpp
 *
 * Lifetime counters of one download manager.
 */

#include "DownloadTask.hpp"

#include <mutex>

namespace modelfetch::core::downloader {

class DownloadStatistics {
public:
    /**
     * Record one terminal result. Called exactly once per finished task.
     */
    void record(const DownloadResult& result);

    /**
     * Count one transport attempt (retries included)
     */
    void recordAttempt();

    DownloadStats snapshot() const;

private:
    mutable std::mutex m_mutex;
    DownloadStats m_stats;

    // Tasks contributing to averageSpeed
    uint64_t m_speedSamples{0};
};

} // namespace modelfetch::core::downloader

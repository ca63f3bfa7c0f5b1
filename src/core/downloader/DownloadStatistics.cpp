/**
 * DownloadStatistics.cpp
 */

#include "DownloadStatistics.hpp"

namespace modelfetch::core::downloader {

void DownloadStatistics::record(const DownloadResult& result) {
    std::lock_guard<std::mutex> lock(m_mutex);

    ++m_stats.totalDownloads;

    if (!result.success) {
        ++m_stats.failedDownloads;
        return;
    }

    ++m_stats.successfulDownloads;
    m_stats.totalBytesDownloaded += result.fileSize;

    // duration is in ms; a zero duration carries no speed information
    if (result.duration > 0.0) {
        double speed = static_cast<double>(result.fileSize) / (result.duration / 1000.0);
        ++m_speedSamples;
        m_stats.averageSpeed += (speed - m_stats.averageSpeed) / static_cast<double>(m_speedSamples);
    }
}

void DownloadStatistics::recordAttempt() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_stats.totalAttempts;
}

DownloadStats DownloadStatistics::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

} // namespace modelfetch::core::downloader

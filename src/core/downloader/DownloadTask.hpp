#pragma once

/**
 * DownloadTask.hpp
 *
 * Value types shared by the download pipeline: task status and progress,
 * per-call options, results and lifetime statistics.
 */

#include <nlohmann/json.hpp>

#include <string>
#include <map>
#include <optional>
#include <functional>
#include <chrono>
#include <cstdint>
#include <utility>

namespace modelfetch::core::downloader {

/**
 * Download task status
 */
enum class DownloadStatus {
    Pending,
    InProgress,
    Paused,
    Completed,
    Failed,
    Cancelled
};

const char* toString(DownloadStatus status);

/**
 * InProgress and Paused are the only states a caller can still control
 */
inline bool isActive(DownloadStatus status) {
    return status == DownloadStatus::InProgress || status == DownloadStatus::Paused;
}

inline bool isTerminal(DownloadStatus status) {
    return status == DownloadStatus::Completed ||
           status == DownloadStatus::Failed ||
           status == DownloadStatus::Cancelled;
}

/**
 * Live progress of one task
 */
struct DownloadProgress {
    // -1 until the server advertises a length
    int64_t totalBytes{-1};
    uint64_t downloadedBytes{0};

    // Only set when totalBytes is known, clamped to [0, 100]
    std::optional<double> percentage;

    // Bytes per second since the task started
    double speed{0.0};

    // Seconds, only set when totalBytes is known and speed > 0
    std::optional<double> estimatedTimeRemaining;

    DownloadStatus status{DownloadStatus::Pending};

    bool hasKnownTotal() const { return totalBytes >= 0; }

    // Unknown values serialize as null
    nlohmann::json toJson() const;
};

/**
 * Event published for every progress report and terminal state
 */
struct DownloadEvent {
    std::string taskId;
    DownloadProgress progress;
};

using ProgressCallback = std::function<void(const DownloadEvent& event)>;

/**
 * Per-call download options. Not persisted.
 */
struct DownloadOptions {
    // Applies to a single attempt
    std::chrono::milliseconds timeout{300000};

    // Attempts beyond the first
    int retries{3};

    // Fixed wait between attempts
    std::chrono::milliseconds retryDelay{1000};

    // Continue from the bytes already on disk via a Range request
    bool resumeSupport{false};

    std::map<std::string, std::string> headers;

    std::string userAgent{"ModelFetch/1.0"};

    // Batch ceiling; unset means the configured default
    std::optional<size_t> maxConcurrent;

    // Lowercase hex SHA-256; when set the result is verified automatically
    std::optional<std::string> expectedChecksum;

    ProgressCallback onProgress;

    /**
     * Defaults from the "downloads" section of Config
     */
    static DownloadOptions fromConfig();
};

/**
 * Outcome of a download. Exactly one of (success with filePath and
 * checksum) or (failure with error) holds.
 */
struct DownloadResult {
    bool success{false};
    std::string taskId;
    std::string filePath;
    uint64_t fileSize{0};

    // Milliseconds from the task start, across all attempts
    double duration{0.0};

    std::string checksum;
    std::string error;

    static DownloadResult succeeded(std::string taskId, std::string filePath, uint64_t fileSize,
                                    double duration, std::string checksum) {
        DownloadResult result;
        result.success = true;
        result.taskId = std::move(taskId);
        result.filePath = std::move(filePath);
        result.fileSize = fileSize;
        result.duration = duration;
        result.checksum = std::move(checksum);
        return result;
    }

    static DownloadResult failed(std::string taskId, std::string error, double duration = 0.0) {
        DownloadResult result;
        result.success = false;
        result.taskId = std::move(taskId);
        result.duration = duration;
        result.error = std::move(error);
        return result;
    }

    nlohmann::json toJson() const;
};

/**
 * Snapshot of one tracked task
 */
struct DownloadTask {
    std::string id;
    std::string url;
    std::string destinationPath;
    DownloadProgress progress;
    std::chrono::system_clock::time_point startedAt;
    std::optional<std::chrono::system_clock::time_point> completedAt;
    std::optional<std::string> error;
    int attempts{0};
    bool resumeSupport{false};

    DownloadStatus status() const { return progress.status; }

    // Timestamps as ISO 8601 UTC
    nlohmann::json toJson() const;
};

/**
 * Lifetime counters of one DownloadManager
 */
struct DownloadStats {
    uint64_t totalDownloads{0};
    uint64_t successfulDownloads{0};
    uint64_t failedDownloads{0};
    uint64_t totalBytesDownloaded{0};

    // Running mean of per-task fileSize / duration, bytes per second
    double averageSpeed{0.0};

    // Transport attempts including retries
    uint64_t totalAttempts{0};

    bool operator==(const DownloadStats& other) const {
        return totalDownloads == other.totalDownloads &&
               successfulDownloads == other.successfulDownloads &&
               failedDownloads == other.failedDownloads &&
               totalBytesDownloaded == other.totalBytesDownloaded &&
               averageSpeed == other.averageSpeed &&
               totalAttempts == other.totalAttempts;
    }

    nlohmann::json toJson() const;
};

} // namespace modelfetch::core::downloader

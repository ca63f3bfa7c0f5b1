/**
 * DownloadTask.cpp
 *
 * Status names, option defaults and JSON forms.
 */

#include "DownloadTask.hpp"
#include "../Config.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace modelfetch::core::downloader {

namespace {

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

nlohmann::json optionalJson(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

const char* toString(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Pending:    return "pending";
        case DownloadStatus::InProgress: return "in_progress";
        case DownloadStatus::Paused:     return "paused";
        case DownloadStatus::Completed:  return "completed";
        case DownloadStatus::Failed:     return "failed";
        case DownloadStatus::Cancelled:  return "cancelled";
    }
    return "unknown";
}

DownloadOptions DownloadOptions::fromConfig() {
    auto& config = Config::instance();

    DownloadOptions options;
    options.timeout = std::chrono::milliseconds(config.get<int64_t>("downloads.timeout", 300000));
    options.retries = config.get<int>("downloads.retries", 3);
    options.retryDelay = std::chrono::milliseconds(config.get<int64_t>("downloads.retryDelay", 1000));
    options.resumeSupport = config.get<bool>("downloads.resumeSupport", false);
    options.userAgent = config.get<std::string>("downloads.userAgent", "ModelFetch/1.0");
    return options;
}

nlohmann::json DownloadProgress::toJson() const {
    return {
        {"status", toString(status)},
        {"totalBytes", hasKnownTotal() ? nlohmann::json(totalBytes) : nlohmann::json(nullptr)},
        {"downloadedBytes", downloadedBytes},
        {"percentage", optionalJson(percentage)},
        {"speed", speed},
        {"estimatedTimeRemaining", optionalJson(estimatedTimeRemaining)}
    };
}

nlohmann::json DownloadResult::toJson() const {
    nlohmann::json j = {
        {"success", success},
        {"taskId", taskId},
        {"duration", duration}
    };

    if (success) {
        j["filePath"] = filePath;
        j["fileSize"] = fileSize;
        j["checksum"] = checksum;
    } else {
        j["error"] = error;
    }
    return j;
}

nlohmann::json DownloadTask::toJson() const {
    nlohmann::json j = {
        {"id", id},
        {"url", url},
        {"destinationPath", destinationPath},
        {"status", toString(status())},
        {"progress", progress.toJson()},
        {"startedAt", formatTimestamp(startedAt)},
        {"attempts", attempts},
        {"resumeSupport", resumeSupport}
    };

    if (completedAt) {
        j["completedAt"] = formatTimestamp(*completedAt);
    }
    if (error) {
        j["error"] = *error;
    }
    return j;
}

nlohmann::json DownloadStats::toJson() const {
    return {
        {"totalDownloads", totalDownloads},
        {"successfulDownloads", successfulDownloads},
        {"failedDownloads", failedDownloads},
        {"totalBytesDownloaded", totalBytesDownloaded},
        {"averageSpeed", averageSpeed},
        {"totalAttempts", totalAttempts}
    };
}

} // namespace modelfetch::core::downloader

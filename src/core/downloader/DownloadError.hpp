#pragma once

/**
 * DownloadError.hpp
 *
 * Failure taxonomy for transfers and the exceptions used for misuse
 * of the task-control API.
 */

#include <string>
#include <stdexcept>

namespace modelfetch::core::downloader {

/**
 * Why an attempt or a task did not succeed
 */
enum class DownloadErrorKind {
    None,
    Network,           // DNS, connection refused/reset
    Timeout,           // attempt exceeded DownloadOptions::timeout
    HttpStatus,        // non-2xx response
    Filesystem,        // mkdir/open/write failure on the destination
    ChecksumMismatch,  // automatic verification failed
    TaskState,         // control call not valid in the task's state
    Interrupted        // paused or cancelled by the caller
};

inline const char* toString(DownloadErrorKind kind) {
    switch (kind) {
        case DownloadErrorKind::None:             return "none";
        case DownloadErrorKind::Network:          return "network";
        case DownloadErrorKind::Timeout:          return "timeout";
        case DownloadErrorKind::HttpStatus:       return "http_status";
        case DownloadErrorKind::Filesystem:       return "filesystem";
        case DownloadErrorKind::ChecksumMismatch: return "checksum_mismatch";
        case DownloadErrorKind::TaskState:        return "task_state";
        case DownloadErrorKind::Interrupted:      return "interrupted";
    }
    return "unknown";
}

/**
 * Retry classification. HTTP errors are retried only for 5xx and 429,
 * since any other status will come back the same on the next attempt.
 */
inline bool isRetryable(DownloadErrorKind kind, long httpStatus = 0) {
    switch (kind) {
        case DownloadErrorKind::Network:
        case DownloadErrorKind::Timeout:
            return true;
        case DownloadErrorKind::HttpStatus:
            return httpStatus == 429 || (httpStatus >= 500 && httpStatus < 600);
        default:
            return false;
    }
}

/**
 * Thrown by resume on a task that is not paused, or by any control call
 * naming an unknown task where a result is mandatory.
 */
class TaskStateError : public std::runtime_error {
public:
    explicit TaskStateError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Thrown by verification when the file to check cannot be read.
 * A digest mismatch is not an error.
 */
class IntegrityError : public std::runtime_error {
public:
    explicit IntegrityError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace modelfetch::core::downloader

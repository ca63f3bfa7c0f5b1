#pragma once

/**
 * TransferUnit.hpp
 *
 * One streamed HTTP GET to disk with a rolling SHA-256.
 */

#include "HttpTransport.hpp"
#include "DownloadError.hpp"
#include "../Clock.hpp"
#include "../../utils/HashUtils.hpp"

#include <string>
#include <functional>
#include <chrono>
#include <cstdint>
#include <utility>

namespace modelfetch::core::downloader {

/**
 * State of a task's file that outlives a single attempt. Owned by the task
 * and touched only by the worker currently running it.
 */
struct TransferState {
    std::string destinationPath;
    bool resumeSupport{false};

    // Digest of exactly the bytes on disk
    utils::Sha256Hasher hasher;
    uint64_t bytesOnDisk{0};

    int64_t totalBytes{-1};

    // Set once this task has opened the destination for writing
    bool fileTouched{false};

    /**
     * Drop the partial file state so the next attempt starts from zero
     */
    void restart() {
        hasher.reset();
        bytesOnDisk = 0;
    }
};

/**
 * Result of one attempt
 */
struct TransferOutcome {
    bool success{false};
    DownloadErrorKind errorKind{DownloadErrorKind::None};
    long httpStatus{0};
    std::string message;

    uint64_t bytesOnDisk{0};
    int64_t totalBytes{-1};
    std::string checksum;

    bool retryable() const {
        return !success && isRetryable(errorKind, httpStatus);
    }

    static TransferOutcome completed(uint64_t bytes, int64_t total, std::string checksum) {
        TransferOutcome outcome;
        outcome.success = true;
        outcome.bytesOnDisk = bytes;
        outcome.totalBytes = total;
        outcome.checksum = std::move(checksum);
        return outcome;
    }

    static TransferOutcome failure(DownloadErrorKind kind, std::string message, long httpStatus = 0) {
        TransferOutcome outcome;
        outcome.errorKind = kind;
        outcome.message = std::move(message);
        outcome.httpStatus = httpStatus;
        return outcome;
    }
};

/**
 * TransferUnit - single download attempt
 *
 * Creates the destination directory, writes chunks as they arrive and
 * hashes them on the way. When the state allows resume and bytes are
 * already on disk, a range request is sent; a 206 appends, anything else
 * restarts the file from zero.
 */
class TransferUnit {
public:
    using ProgressFn = std::function<void(uint64_t downloadedBytes, int64_t totalBytes)>;

    TransferUnit(HttpTransport& transport, Clock& clock,
                 std::chrono::milliseconds progressInterval = std::chrono::milliseconds(100));

    /**
     * Run one attempt
     * @param request URL, headers, timeout (rangeStart is filled in here)
     * @param state Per-task file state, updated in place
     * @param interrupted Polled between chunks; true aborts with Interrupted
     * @param onProgress Throttled progress reports, plus one at the end
     */
    TransferOutcome run(TransferRequest request,
                        TransferState& state,
                        const std::function<bool()>& interrupted,
                        const ProgressFn& onProgress);

private:
    HttpTransport& m_transport;
    Clock& m_clock;
    std::chrono::milliseconds m_progressInterval;
};

} // namespace modelfetch::core::downloader

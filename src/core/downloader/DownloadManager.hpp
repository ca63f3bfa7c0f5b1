#pragma once

/**
 * DownloadManager.hpp
 *
 * Parallel download manager for large model files.
 * Bounded batches, retries, integrity checks, pause/resume/cancel,
 * live progress and lifetime statistics.
 */

#include "DownloadTask.hpp"
#include "DownloadStatistics.hpp"
#include "HttpTransport.hpp"
#include "TaskRegistry.hpp"
#include "../Clock.hpp"
#include "../EventBus.hpp"

#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <future>
#include <optional>
#include <chrono>

namespace modelfetch::core::downloader {

/**
 * One item of a batch
 */
struct BatchRequest {
    std::string url;
    std::string destinationPath;

    // Unset means DownloadOptions::fromConfig()
    std::optional<DownloadOptions> options;
};

/**
 * Download running in the background
 */
struct DownloadHandle {
    std::string taskId;
    std::future<DownloadResult> result;
};

/**
 * DownloadManager - Parallel download management
 *
 * Features:
 * - At most maxConcurrent transfers per batch, admitted in submission order
 * - Results aligned with the request order, failures isolated per item
 * - Fixed-delay retries for network errors, timeouts, 5xx and 429
 * - Rolling SHA-256, verified automatically when a checksum is expected
 * - Pause/resume (byte ranges when enabled) and cancel by task id
 * - Progress events for every task through one event bus
 *
 * Transfer failures are reported in DownloadResult, never thrown.
 */
class DownloadManager {
public:
    /**
     * Constructor
     * @param transport HTTP implementation (null = CprTransport)
     * @param clock Time source for retry waits and durations
     */
    explicit DownloadManager(std::shared_ptr<HttpTransport> transport = nullptr,
                             Clock& clock = Clock::system());

    /**
     * Destructor - cancels active downloads and waits for background ones
     */
    ~DownloadManager();

    // Disable copy
    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    /**
     * Download one file, blocking until it finishes, fails, or is paused
     * @param url Source URL
     * @param destinationPath Target file (parent directories are created)
     * @param options Per-call options
     * @return Result; a paused task returns success=false with its taskId
     * @throws std::invalid_argument on an empty url or destination
     */
    DownloadResult downloadModel(const std::string& url,
                                 const std::string& destinationPath,
                                 const DownloadOptions& options = DownloadOptions::fromConfig());

    /**
     * Start one download in the background
     * @throws std::invalid_argument on an empty url or destination
     */
    DownloadHandle startDownload(const std::string& url,
                                 const std::string& destinationPath,
                                 const DownloadOptions& options = DownloadOptions::fromConfig());

    /**
     * Download several files with bounded parallelism
     * @param requests Items, result[i] belongs to requests[i]
     * @param maxConcurrent Ceiling; unset uses the first request option
     *                      that sets one, then downloads.maxConcurrent
     * @return One result per request
     */
    std::vector<DownloadResult> downloadBatch(const std::vector<BatchRequest>& requests,
                                              std::optional<size_t> maxConcurrent = std::nullopt);

    /**
     * Continue a paused task, blocking until it finishes or pauses again
     * @throws TaskStateError if the task is unknown or not paused
     */
    DownloadResult resumeDownload(const std::string& taskId);

    /**
     * Pause an in-progress task
     * @return false if the task is unknown or not in progress
     */
    bool pauseDownload(const std::string& taskId);

    /**
     * Cancel an in-progress or paused task. The partial file is deleted
     * unless the task was started with resumeSupport.
     * @return false if the task is unknown or not active
     */
    bool cancelDownload(const std::string& taskId);

    /**
     * Cancel every active task and every batch item not yet started
     */
    void cancelAll();

    std::optional<DownloadProgress> getDownloadProgress(const std::string& taskId) const;

    /**
     * Active tasks plus the recent history of finished ones
     */
    std::vector<DownloadTask> getActiveTasks() const;

    /**
     * @throws IntegrityError if the file is missing
     */
    bool verifyDownload(const std::string& filePath, const std::string& expectedChecksum) const;

    DownloadStats getDownloadStats() const;

    /**
     * Drop finished tasks from the registry; statistics are kept
     * @param olderThan Retention window, all finished tasks when unset
     */
    void cleanupTasks(std::optional<std::chrono::seconds> olderThan = std::nullopt);

    /**
     * Receive progress events of every task
     */
    SubscriptionPtr subscribe(EventBus<DownloadEvent>::Callback callback);
    void unsubscribe(const SubscriptionPtr& subscription);

private:
    TaskEntryPtr createTask(const std::string& url,
                            const std::string& destinationPath,
                            const DownloadOptions& options);

    /**
     * Admit and run a freshly registered task
     * @param epoch Cancel epoch seen when the task was requested; a cancelAll
     *        since then cancels the task as soon as it is admitted
     */
    DownloadResult startTask(const TaskEntryPtr& entry, uint64_t epoch);

    /**
     * runTask() with the per-call progress callback subscribed, then give
     * up the worker role. A cancel that arrived while the worker was
     * leaving is finished here.
     */
    DownloadResult runOwned(const TaskEntryPtr& entry);

    /**
     * Retry loop and bookkeeping. Caller holds entry->runMutex and the
     * task is InProgress.
     */
    DownloadResult runTask(const TaskEntryPtr& entry);

    /**
     * Result of a run stopped by pause or cancel
     * @param finished Set when the transfer itself had already completed
     */
    DownloadResult finishInterrupted(const TaskEntryPtr& entry,
                                     const std::optional<TransferOutcome>& finished);

    /**
     * @param notifyCaller Also hand the final state to options.onProgress,
     *        for cancels that happen while no run is subscribed
     */
    DownloadResult finishCancelled(const TaskEntryPtr& entry, bool notifyCaller = false);

    DownloadResult finishFailed(const TaskEntryPtr& entry, const std::string& error);

    void publishProgress(const TaskEntryPtr& entry, uint64_t downloadedBytes, int64_t totalBytes);

    void publishStatus(const std::string& taskId);

    double elapsedMs(const TaskEntryPtr& entry) const;

private:
    std::shared_ptr<HttpTransport> m_transport;
    Clock& m_clock;

    TaskRegistry m_registry;
    DownloadStatistics m_statistics;
    EventBus<DownloadEvent> m_events;

    std::chrono::milliseconds m_progressInterval;

    // Bumped by cancelAll; tasks requested under an older epoch never run
    std::atomic<uint64_t> m_cancelEpoch{0};

    std::mutex m_backgroundMutex;
    std::condition_variable m_backgroundCondition;
    size_t m_backgroundTasks{0};
};

} // namespace modelfetch::core::downloader

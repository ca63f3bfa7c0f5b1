#pragma once

/**
 * TaskRegistry.hpp
 *
 * Owns every task of a download manager: its live snapshot, the control
 * flags its worker polls, and the bounded history of finished tasks.
 */

#include "DownloadTask.hpp"
#include "TransferUnit.hpp"
#include "../Clock.hpp"

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <optional>
#include <chrono>
#include <cstdint>

namespace modelfetch::core::downloader {

/**
 * Registry record of one task.
 *
 * `id` never changes after registration. `snapshot` is guarded by the
 * registry mutex and only read through the registry. `transfer` and
 * `finishedTransfer` belong to whichever worker holds `runMutex`.
 */
struct TaskEntry {
    uint64_t sequence{0};
    std::string id;
    DownloadTask snapshot;
    DownloadOptions options;

    // Steady start time, durations are measured from here
    Clock::TimePoint startTime;

    std::mutex runMutex;
    TransferState transfer;

    // Transfer that finished while a pause was racing it
    std::optional<TransferOutcome> finishedTransfer;

    std::atomic<bool> pauseRequested{false};
    std::atomic<bool> cancelRequested{false};

    // A worker is running this task; guarded by the registry mutex
    bool workerActive{false};

    bool interrupted() const {
        return pauseRequested.load() || cancelRequested.load();
    }

    /**
     * Claim the one-time terminal bookkeeping (statistics, cleanup)
     * @return true for the first caller only
     */
    bool claimFinalization() {
        return !m_finalized.exchange(true);
    }

private:
    std::atomic<bool> m_finalized{false};
};

using TaskEntryPtr = std::shared_ptr<TaskEntry>;

/**
 * What a cancel found. Without an active worker the canceller has to do
 * the terminal bookkeeping itself.
 */
struct CancelTicket {
    DownloadStatus from{DownloadStatus::InProgress};
    bool workerActive{false};
};

/**
 * TaskRegistry
 *
 * State machine:
 *   Pending    -> InProgress
 *   InProgress -> Paused | Completed | Failed | Cancelled
 *   Paused     -> InProgress | Cancelled
 */
class TaskRegistry {
public:
    /**
     * @param historyLimit Finished tasks kept before the oldest are evicted
     */
    explicit TaskRegistry(size_t historyLimit = 100);

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    /**
     * Create a Pending task with a fresh id
     */
    TaskEntryPtr registerTask(const std::string& url,
                              const std::string& destinationPath,
                              const DownloadOptions& options,
                              Clock::TimePoint startTime);

    TaskEntryPtr find(const std::string& id) const;

    std::optional<DownloadTask> get(const std::string& id) const;

    std::optional<DownloadStatus> status(const std::string& id) const;

    /**
     * All tracked tasks in registration order
     */
    std::vector<DownloadTask> list() const;

    /**
     * Pending -> InProgress. The caller becomes the task's worker until
     * releaseWorker().
     */
    bool admit(const std::string& id);

    /**
     * InProgress -> Paused. The worker aborts its current attempt.
     * @return false if the task is unknown or not InProgress
     */
    bool pause(const std::string& id);

    /**
     * Paused -> InProgress. When the task cannot continue from its byte
     * offset the reported progress starts over from zero. The caller
     * becomes the task's worker until releaseWorker().
     * @throws TaskStateError if the task is unknown or not Paused
     */
    TaskEntryPtr prepareResume(const std::string& id);

    /**
     * InProgress|Paused -> Cancelled
     * @return Status before the cancel, empty if nothing was cancelled
     */
    std::optional<CancelTicket> cancel(const std::string& id);

    /**
     * End the caller's run of a task
     * @return true if the task was cancelled meanwhile; the leaving worker
     *         then owes the cancel bookkeeping
     */
    bool releaseWorker(const TaskEntryPtr& entry);

    /**
     * Ids of all InProgress and Paused tasks
     */
    std::vector<std::string> activeIds() const;

    /**
     * Store a progress report of an InProgress task. downloadedBytes never
     * goes backwards; lower reports (a retry starting over) keep the old value.
     * @return The stored progress, empty if the task is not InProgress
     */
    std::optional<DownloadProgress> updateProgress(const std::string& id, DownloadProgress progress);

    void recordAttempt(const std::string& id);

    /**
     * InProgress -> Completed|Failed, or record the final state of a task
     * that was already Cancelled.
     * @return false if the transition is not allowed
     */
    bool finish(const std::string& id,
                DownloadStatus status,
                const DownloadProgress& progress,
                const std::optional<std::string>& error = std::nullopt);

    /**
     * Remove finished tasks
     * @param olderThan Only tasks finished longer ago than this; all when empty
     * @return Number of removed tasks
     */
    size_t cleanup(std::optional<std::chrono::seconds> olderThan = std::nullopt);

    size_t size() const;

    static bool canTransition(DownloadStatus from, DownloadStatus to);

private:
    void evictHistory();

    mutable std::mutex m_mutex;
    std::map<std::string, TaskEntryPtr> m_tasks;
    std::map<uint64_t, std::string> m_order;

    size_t m_historyLimit;
    uint64_t m_nextId{1};
};

} // namespace modelfetch::core::downloader

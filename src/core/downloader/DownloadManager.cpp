/**
 * DownloadManager.cpp
 *
 * Implementation of the parallel download manager.
 */

#include "DownloadManager.hpp"
#include "CprTransport.hpp"
#include "DownloadError.hpp"
#include "IntegrityVerifier.hpp"
#include "RetryPolicy.hpp"
#include "TransferUnit.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../ThreadPool.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace modelfetch::core::downloader {

using utils::StringUtils;

namespace {

/**
 * Keeps a per-call progress callback subscribed for the lifetime of one run
 */
class ScopedSubscription {
public:
    ScopedSubscription(EventBus<DownloadEvent>& bus, SubscriptionPtr subscription)
        : m_bus(bus), m_subscription(std::move(subscription)) {}

    ~ScopedSubscription() {
        m_bus.unsubscribe(m_subscription);
    }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

private:
    EventBus<DownloadEvent>& m_bus;
    SubscriptionPtr m_subscription;
};

void removePartialFile(TransferState& transfer) {
    if (!transfer.fileTouched) {
        return;
    }

    std::error_code ec;
    std::filesystem::remove(transfer.destinationPath, ec);
    if (ec) {
        LOG_WARN("Could not remove {}: {}", transfer.destinationPath, ec.message());
    }
    transfer.restart();
    transfer.fileTouched = false;
}

} // namespace

DownloadManager::DownloadManager(std::shared_ptr<HttpTransport> transport, Clock& clock)
    : m_transport(transport ? std::move(transport) : std::make_shared<CprTransport>())
    , m_clock(clock)
    , m_registry(Config::instance().get<size_t>("downloads.historyLimit", 100))
    , m_progressInterval(Config::instance().get<int64_t>("downloads.progressIntervalMs", 100)) {

    LOG_DEBUG("DownloadManager created (progress interval: {} ms)", m_progressInterval.count());
}

DownloadManager::~DownloadManager() {
    cancelAll();

    std::unique_lock<std::mutex> lock(m_backgroundMutex);
    m_backgroundCondition.wait(lock, [this] {
        return m_backgroundTasks == 0;
    });
}

DownloadResult DownloadManager::downloadModel(const std::string& url,
                                              const std::string& destinationPath,
                                              const DownloadOptions& options) {
    uint64_t epoch = m_cancelEpoch.load();
    return startTask(createTask(url, destinationPath, options), epoch);
}

DownloadHandle DownloadManager::startDownload(const std::string& url,
                                              const std::string& destinationPath,
                                              const DownloadOptions& options) {
    uint64_t epoch = m_cancelEpoch.load();
    TaskEntryPtr entry = createTask(url, destinationPath, options);

    {
        std::lock_guard<std::mutex> lock(m_backgroundMutex);
        ++m_backgroundTasks;
    }

    DownloadHandle handle;
    handle.taskId = entry->id;
    handle.result = std::async(std::launch::async, [this, entry, epoch]() {
        DownloadResult result;
        try {
            result = startTask(entry, epoch);
        } catch (const std::exception& e) {
            LOG_ERROR("Background download {} failed: {}", entry->id, e.what());
            result = DownloadResult::failed(entry->id, e.what());
        }

        std::lock_guard<std::mutex> lock(m_backgroundMutex);
        --m_backgroundTasks;
        m_backgroundCondition.notify_all();
        return result;
    });

    return handle;
}

std::vector<DownloadResult> DownloadManager::downloadBatch(const std::vector<BatchRequest>& requests,
                                                           std::optional<size_t> maxConcurrent) {
    if (requests.empty()) {
        return {};
    }

    size_t limit = 0;
    if (maxConcurrent) {
        limit = *maxConcurrent;
    } else {
        auto withLimit = std::find_if(requests.begin(), requests.end(), [](const BatchRequest& request) {
            return request.options && request.options->maxConcurrent;
        });
        limit = withLimit != requests.end()
            ? *withLimit->options->maxConcurrent
            : Config::instance().get<size_t>("downloads.maxConcurrent", 4);
    }
    limit = std::max<size_t>(1, std::min(limit, requests.size()));

    LOG_INFO("Starting batch of {} downloads ({} at a time)", requests.size(), limit);

    uint64_t epoch = m_cancelEpoch.load();
    std::vector<std::future<DownloadResult>> futures;
    futures.reserve(requests.size());

    std::vector<DownloadResult> results;
    results.reserve(requests.size());

    {
        ThreadPool pool(limit);

        for (const auto& request : requests) {
            futures.push_back(pool.submit([this, &request, epoch]() {
                if (m_cancelEpoch.load() != epoch) {
                    DownloadResult cancelled = DownloadResult::failed("", "Download cancelled before start");
                    m_statistics.record(cancelled);
                    return cancelled;
                }

                try {
                    DownloadOptions options = request.options ? *request.options : DownloadOptions::fromConfig();
                    return startTask(createTask(request.url, request.destinationPath, options), epoch);
                } catch (const std::exception& e) {
                    LOG_ERROR("Batch item {} failed: {}", request.url, e.what());
                    return DownloadResult::failed("", e.what());
                }
            }));
        }

        for (auto& future : futures) {
            results.push_back(future.get());
        }
        LOG_DEBUG("Batch ran at most {} downloads at once", pool.peakRunning());
    }

    size_t succeeded = std::count_if(results.begin(), results.end(), [](const DownloadResult& result) {
        return result.success;
    });
    LOG_INFO("Batch finished: {}/{} succeeded", succeeded, results.size());

    return results;
}

DownloadResult DownloadManager::resumeDownload(const std::string& taskId) {
    TaskEntryPtr entry = m_registry.find(taskId);
    if (!entry) {
        throw TaskStateError("cannot resume " + taskId + ": unknown task");
    }

    // Waits for the paused worker to let go of the file
    std::lock_guard<std::mutex> lock(entry->runMutex);
    m_registry.prepareResume(taskId);

    if (entry->options.resumeSupport && entry->transfer.bytesOnDisk > 0) {
        LOG_INFO("Resuming download {} at byte {}", taskId, entry->transfer.bytesOnDisk);
    } else {
        LOG_INFO("Resuming download {} from the start", taskId);
    }

    publishStatus(taskId);
    return runOwned(entry);
}

bool DownloadManager::pauseDownload(const std::string& taskId) {
    if (!m_registry.pause(taskId)) {
        return false;
    }

    LOG_INFO("Pausing download {}", taskId);
    publishStatus(taskId);
    return true;
}

bool DownloadManager::cancelDownload(const std::string& taskId) {
    TaskEntryPtr entry = m_registry.find(taskId);
    if (!entry) {
        return false;
    }

    std::optional<CancelTicket> ticket = m_registry.cancel(taskId);
    if (!ticket) {
        return false;
    }

    LOG_INFO("Cancelling download {} ({})", taskId, toString(ticket->from));

    // A worker, possibly the one calling us from a progress callback,
    // finishes the bookkeeping itself on its way out
    if (!ticket->workerActive) {
        std::lock_guard<std::mutex> lock(entry->runMutex);
        finishCancelled(entry, true);
    }
    return true;
}

void DownloadManager::cancelAll() {
    ++m_cancelEpoch;

    for (const auto& id : m_registry.activeIds()) {
        cancelDownload(id);
    }
}

std::optional<DownloadProgress> DownloadManager::getDownloadProgress(const std::string& taskId) const {
    auto task = m_registry.get(taskId);
    if (!task) {
        return std::nullopt;
    }
    return task->progress;
}

std::vector<DownloadTask> DownloadManager::getActiveTasks() const {
    return m_registry.list();
}

bool DownloadManager::verifyDownload(const std::string& filePath, const std::string& expectedChecksum) const {
    return IntegrityVerifier::verify(filePath, expectedChecksum);
}

DownloadStats DownloadManager::getDownloadStats() const {
    return m_statistics.snapshot();
}

void DownloadManager::cleanupTasks(std::optional<std::chrono::seconds> olderThan) {
    m_registry.cleanup(olderThan);
}

SubscriptionPtr DownloadManager::subscribe(EventBus<DownloadEvent>::Callback callback) {
    return m_events.subscribe(std::move(callback));
}

void DownloadManager::unsubscribe(const SubscriptionPtr& subscription) {
    m_events.unsubscribe(subscription);
}

TaskEntryPtr DownloadManager::createTask(const std::string& url,
                                         const std::string& destinationPath,
                                         const DownloadOptions& options) {
    if (StringUtils::trim(url).empty()) {
        throw std::invalid_argument("download url must not be empty");
    }
    if (StringUtils::trim(destinationPath).empty()) {
        throw std::invalid_argument("download destination must not be empty");
    }

    return m_registry.registerTask(url, destinationPath, options, m_clock.now());
}

DownloadResult DownloadManager::startTask(const TaskEntryPtr& entry, uint64_t epoch) {
    std::lock_guard<std::mutex> lock(entry->runMutex);

    if (!m_registry.admit(entry->id)) {
        return DownloadResult::failed(entry->id, "task " + entry->id + " could not be started");
    }

    // cancelAll bumps the epoch before it lists active tasks, so a task
    // admitted after that list was taken is caught here
    if (m_cancelEpoch.load() != epoch) {
        LOG_INFO("Download {} cancelled before it started", entry->id);
        m_registry.cancel(entry->id);
    }

    LOG_INFO("Downloading {} -> {} ({})", entry->snapshot.url, entry->snapshot.destinationPath, entry->id);
    publishStatus(entry->id);
    return runOwned(entry);
}

DownloadResult DownloadManager::runOwned(const TaskEntryPtr& entry) {
    const std::string& id = entry->id;

    SubscriptionPtr callerSubscription;
    if (entry->options.onProgress) {
        callerSubscription = m_events.subscribe([id, callback = entry->options.onProgress](const DownloadEvent& event) {
            if (event.taskId == id) {
                callback(event);
            }
        });
    }
    ScopedSubscription subscriptionGuard(m_events, callerSubscription);

    DownloadResult result;
    try {
        result = runTask(entry);
    } catch (const std::exception&) {
        m_registry.releaseWorker(entry);
        throw;
    }

    if (m_registry.releaseWorker(entry)) {
        return finishCancelled(entry);
    }
    return result;
}

DownloadResult DownloadManager::runTask(const TaskEntryPtr& entry) {
    const std::string& id = entry->id;
    const DownloadOptions& options = entry->options;

    RetryOutcome outcome;
    if (entry->finishedTransfer) {
        outcome.last = *entry->finishedTransfer;
        entry->finishedTransfer.reset();
    } else {
        RetryPolicy policy(options.retries, options.retryDelay, m_clock);
        TransferUnit unit(*m_transport, m_clock, m_progressInterval);

        TransferRequest request;
        request.url = entry->snapshot.url;
        request.headers = options.headers;
        request.userAgent = options.userAgent;
        request.timeout = options.timeout;

        auto interrupted = [&entry]() { return entry->interrupted(); };

        outcome = policy.run(
            [&](int attempt) {
                m_statistics.recordAttempt();
                m_registry.recordAttempt(id);
                LOG_DEBUG("{}: attempt {}/{}", id, attempt, policy.maxAttempts());

                return unit.run(request, entry->transfer, interrupted,
                    [this, &entry](uint64_t downloadedBytes, int64_t totalBytes) {
                        publishProgress(entry, downloadedBytes, totalBytes);
                    });
            },
            interrupted);
    }

    if (outcome.interrupted() || entry->interrupted()) {
        return finishInterrupted(entry, outcome.success() ? std::optional<TransferOutcome>(outcome.last)
                                                          : std::nullopt);
    }

    if (!outcome.success()) {
        return finishFailed(entry, outcome.errorMessage());
    }

    const TransferOutcome& transfer = outcome.last;

    if (options.expectedChecksum &&
        !IntegrityVerifier::matches(transfer.checksum, *options.expectedChecksum)) {
        removePartialFile(entry->transfer);
        return finishFailed(entry, "checksum mismatch for " + entry->transfer.destinationPath +
                                   ": expected " + IntegrityVerifier::normalize(*options.expectedChecksum) +
                                   ", got " + transfer.checksum);
    }

    double duration = elapsedMs(entry);

    DownloadProgress progress;
    progress.downloadedBytes = transfer.bytesOnDisk;
    progress.totalBytes = transfer.totalBytes >= 0 ? transfer.totalBytes
                                                   : static_cast<int64_t>(transfer.bytesOnDisk);
    progress.percentage = 100.0;
    progress.estimatedTimeRemaining = 0.0;
    progress.speed = duration > 0.0 ? static_cast<double>(transfer.bytesOnDisk) / (duration / 1000.0) : 0.0;

    if (!m_registry.finish(id, DownloadStatus::Completed, progress)) {
        // Lost a race against pause or cancel
        return finishInterrupted(entry, transfer);
    }

    DownloadResult result = DownloadResult::succeeded(
        id, entry->transfer.destinationPath, transfer.bytesOnDisk, duration, transfer.checksum);

    if (entry->claimFinalization()) {
        m_statistics.record(result);
    }

    LOG_INFO("Downloaded {} ({}) in {}", result.filePath,
             StringUtils::formatBytes(static_cast<int64_t>(result.fileSize)),
             StringUtils::formatMillis(result.duration));

    publishStatus(id);
    return result;
}

DownloadResult DownloadManager::finishInterrupted(const TaskEntryPtr& entry,
                                                  const std::optional<TransferOutcome>& finished) {
    auto status = m_registry.status(entry->id);

    if (entry->cancelRequested || status == DownloadStatus::Cancelled) {
        return finishCancelled(entry);
    }

    if (status == DownloadStatus::Paused) {
        if (finished) {
            entry->finishedTransfer = finished;
        }
        LOG_INFO("Download {} paused at {} bytes", entry->id, entry->transfer.bytesOnDisk);
        return DownloadResult::failed(entry->id, "Download paused", elapsedMs(entry));
    }

    return finishFailed(entry, "interrupted");
}

DownloadResult DownloadManager::finishCancelled(const TaskEntryPtr& entry, bool notifyCaller) {
    DownloadResult result = DownloadResult::failed(entry->id, "Download cancelled", elapsedMs(entry));

    if (!entry->claimFinalization()) {
        return result;
    }

    if (!entry->options.resumeSupport) {
        removePartialFile(entry->transfer);
    }

    DownloadProgress progress;
    if (auto task = m_registry.get(entry->id)) {
        progress = task->progress;
    }
    m_registry.finish(entry->id, DownloadStatus::Cancelled, progress, std::string("cancelled"));

    m_statistics.record(result);
    LOG_INFO("Download {} cancelled", entry->id);

    // Built here rather than read back: history eviction may already have
    // dropped the task
    progress.status = DownloadStatus::Cancelled;
    progress.speed = 0.0;
    progress.estimatedTimeRemaining.reset();
    DownloadEvent event{entry->id, progress};
    m_events.emit(event);

    if (notifyCaller && entry->options.onProgress) {
        try {
            entry->options.onProgress(event);
        } catch (const std::exception& e) {
            LOG_WARN("Progress callback of {} threw: {}", entry->id, e.what());
        }
    }
    return result;
}

DownloadResult DownloadManager::finishFailed(const TaskEntryPtr& entry, const std::string& error) {
    DownloadProgress progress;
    if (auto task = m_registry.get(entry->id)) {
        progress = task->progress;
    }
    progress.estimatedTimeRemaining.reset();

    if (!m_registry.finish(entry->id, DownloadStatus::Failed, progress, error)) {
        auto status = m_registry.status(entry->id);
        if (status == DownloadStatus::Paused || status == DownloadStatus::Cancelled) {
            return finishInterrupted(entry, std::nullopt);
        }
    }

    DownloadResult result = DownloadResult::failed(entry->id, error, elapsedMs(entry));
    if (entry->claimFinalization()) {
        m_statistics.record(result);
    }

    LOG_ERROR("Download {} failed: {}", entry->id, error);

    publishStatus(entry->id);
    return result;
}

void DownloadManager::publishProgress(const TaskEntryPtr& entry, uint64_t downloadedBytes, int64_t totalBytes) {
    double seconds = elapsedMs(entry) / 1000.0;

    DownloadProgress progress;
    progress.totalBytes = totalBytes;
    progress.downloadedBytes = downloadedBytes;
    progress.speed = seconds > 0.0 ? static_cast<double>(downloadedBytes) / seconds : 0.0;

    if (totalBytes > 0) {
        double percent = static_cast<double>(downloadedBytes) * 100.0 / static_cast<double>(totalBytes);
        progress.percentage = std::clamp(percent, 0.0, 100.0);
    } else if (totalBytes == 0) {
        progress.percentage = 100.0;
    }

    if (totalBytes >= 0 && progress.speed > 0.0) {
        double remaining = static_cast<double>(totalBytes) - static_cast<double>(downloadedBytes);
        progress.estimatedTimeRemaining = std::max(0.0, remaining) / progress.speed;
    }

    if (auto stored = m_registry.updateProgress(entry->id, progress)) {
        m_events.emit(DownloadEvent{entry->id, *stored});
    }
}

void DownloadManager::publishStatus(const std::string& taskId) {
    if (auto task = m_registry.get(taskId)) {
        m_events.emit(DownloadEvent{taskId, task->progress});
    }
}

double DownloadManager::elapsedMs(const TaskEntryPtr& entry) const {
    return std::chrono::duration<double, std::milli>(m_clock.now() - entry->startTime).count();
}

} // namespace modelfetch::core::downloader

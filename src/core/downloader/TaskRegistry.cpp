/**
 * TaskRegistry.cpp
 */

#include "TaskRegistry.hpp"
#include "DownloadError.hpp"
#include "../Logger.hpp"

#include <algorithm>

namespace modelfetch::core::downloader {

TaskRegistry::TaskRegistry(size_t historyLimit)
    : m_historyLimit(historyLimit) {
}

bool TaskRegistry::canTransition(DownloadStatus from, DownloadStatus to) {
    switch (from) {
        case DownloadStatus::Pending:
            return to == DownloadStatus::InProgress;
        case DownloadStatus::InProgress:
            return to == DownloadStatus::Paused ||
                   to == DownloadStatus::Completed ||
                   to == DownloadStatus::Failed ||
                   to == DownloadStatus::Cancelled;
        case DownloadStatus::Paused:
            return to == DownloadStatus::InProgress || to == DownloadStatus::Cancelled;
        case DownloadStatus::Completed:
        case DownloadStatus::Failed:
        case DownloadStatus::Cancelled:
            return false;
    }
    return false;
}

TaskEntryPtr TaskRegistry::registerTask(const std::string& url,
                                        const std::string& destinationPath,
                                        const DownloadOptions& options,
                                        Clock::TimePoint startTime) {
    auto entry = std::make_shared<TaskEntry>();
    entry->options = options;
    entry->startTime = startTime;
    entry->transfer.destinationPath = destinationPath;
    entry->transfer.resumeSupport = options.resumeSupport;

    DownloadTask& task = entry->snapshot;
    task.url = url;
    task.destinationPath = destinationPath;
    task.startedAt = std::chrono::system_clock::now();
    task.resumeSupport = options.resumeSupport;
    task.progress.status = DownloadStatus::Pending;

    std::lock_guard<std::mutex> lock(m_mutex);
    entry->sequence = m_nextId++;
    entry->id = "dl_" + std::to_string(entry->sequence);
    task.id = entry->id;
    m_tasks[task.id] = entry;
    m_order[entry->sequence] = task.id;

    LOG_DEBUG("Registered task {}: {} -> {}", task.id, url, destinationPath);
    return entry;
}

TaskEntryPtr TaskRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    return it != m_tasks.end() ? it->second : nullptr;
}

std::optional<DownloadTask> TaskRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    return it->second->snapshot;
}

std::optional<DownloadStatus> TaskRegistry::status(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    return it->second->snapshot.status();
}

std::vector<DownloadTask> TaskRegistry::list() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<DownloadTask> tasks;
    tasks.reserve(m_order.size());
    for (const auto& [sequence, id] : m_order) {
        tasks.push_back(m_tasks.at(id)->snapshot);
    }
    return tasks;
}

std::vector<std::string> TaskRegistry::activeIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<std::string> ids;
    for (const auto& [sequence, id] : m_order) {
        if (isActive(m_tasks.at(id)->snapshot.status())) {
            ids.push_back(id);
        }
    }
    return ids;
}

bool TaskRegistry::admit(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return false;
    }

    DownloadProgress& progress = it->second->snapshot.progress;
    if (!canTransition(progress.status, DownloadStatus::InProgress)) {
        return false;
    }
    progress.status = DownloadStatus::InProgress;
    it->second->workerActive = true;
    return true;
}

bool TaskRegistry::pause(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return false;
    }

    TaskEntry& entry = *it->second;
    if (entry.snapshot.status() != DownloadStatus::InProgress) {
        return false;
    }

    entry.snapshot.progress.status = DownloadStatus::Paused;
    entry.snapshot.progress.speed = 0.0;
    entry.snapshot.progress.estimatedTimeRemaining.reset();
    entry.pauseRequested = true;
    return true;
}

TaskEntryPtr TaskRegistry::prepareResume(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        throw TaskStateError("cannot resume " + id + ": unknown task");
    }

    TaskEntry& entry = *it->second;
    DownloadStatus current = entry.snapshot.status();
    if (current != DownloadStatus::Paused) {
        throw TaskStateError("cannot resume " + id + ": task is " + toString(current) + ", not paused");
    }

    DownloadProgress& progress = entry.snapshot.progress;
    progress.status = DownloadStatus::InProgress;
    if (!entry.options.resumeSupport && !entry.finishedTransfer) {
        progress.downloadedBytes = 0;
        progress.percentage = progress.hasKnownTotal() ? std::optional<double>(0.0) : std::nullopt;
    }
    entry.pauseRequested = false;
    entry.workerActive = true;
    return it->second;
}

std::optional<CancelTicket> TaskRegistry::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return std::nullopt;
    }

    TaskEntry& entry = *it->second;
    DownloadStatus previous = entry.snapshot.status();
    if (!isActive(previous)) {
        return std::nullopt;
    }

    entry.snapshot.progress.status = DownloadStatus::Cancelled;
    entry.snapshot.progress.speed = 0.0;
    entry.snapshot.progress.estimatedTimeRemaining.reset();
    entry.snapshot.completedAt = std::chrono::system_clock::now();
    entry.snapshot.error = "cancelled";
    entry.cancelRequested = true;

    CancelTicket ticket{previous, entry.workerActive};
    evictHistory();
    return ticket;
}

bool TaskRegistry::releaseWorker(const TaskEntryPtr& entry) {
    // The entry may already be evicted from history, so it is not looked up
    std::lock_guard<std::mutex> lock(m_mutex);
    entry->workerActive = false;
    return entry->snapshot.status() == DownloadStatus::Cancelled;
}

std::optional<DownloadProgress> TaskRegistry::updateProgress(const std::string& id, DownloadProgress progress) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return std::nullopt;
    }

    DownloadProgress& current = it->second->snapshot.progress;
    if (current.status != DownloadStatus::InProgress) {
        return std::nullopt;
    }

    if (progress.downloadedBytes < current.downloadedBytes) {
        // Keep the high-water mark; only the total may change underneath it
        if (progress.hasKnownTotal()) {
            current.totalBytes = progress.totalBytes;
        }
        return current;
    }

    progress.status = DownloadStatus::InProgress;
    current = progress;
    return current;
}

void TaskRegistry::recordAttempt(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it != m_tasks.end()) {
        ++it->second->snapshot.attempts;
    }
}

bool TaskRegistry::finish(const std::string& id,
                          DownloadStatus status,
                          const DownloadProgress& progress,
                          const std::optional<std::string>& error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_tasks.find(id);
    if (it == m_tasks.end()) {
        return false;
    }

    DownloadTask& task = it->second->snapshot;
    DownloadStatus current = task.status();

    // A cancelled task keeps its status; only its final numbers are filled in
    bool recordingCancel = current == DownloadStatus::Cancelled && status == DownloadStatus::Cancelled;
    if (!recordingCancel && !canTransition(current, status)) {
        return false;
    }

    task.progress = progress;
    task.progress.status = status;
    task.progress.speed = status == DownloadStatus::Completed ? progress.speed : 0.0;
    if (!task.completedAt) {
        task.completedAt = std::chrono::system_clock::now();
    }
    if (error) {
        task.error = error;
    }

    evictHistory();
    return true;
}

size_t TaskRegistry::cleanup(std::optional<std::chrono::seconds> olderThan) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto now = std::chrono::system_clock::now();
    size_t removed = 0;

    for (auto it = m_order.begin(); it != m_order.end();) {
        const DownloadTask& task = m_tasks.at(it->second)->snapshot;

        bool expired = isTerminal(task.status()) &&
            (!olderThan || (task.completedAt && now - *task.completedAt > *olderThan));

        if (expired) {
            m_tasks.erase(it->second);
            it = m_order.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        LOG_DEBUG("Cleaned up {} finished tasks", removed);
    }
    return removed;
}

size_t TaskRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void TaskRegistry::evictHistory() {
    size_t terminal = std::count_if(m_tasks.begin(), m_tasks.end(), [](const auto& item) {
        return isTerminal(item.second->snapshot.status());
    });

    // Oldest registrations go first
    for (auto it = m_order.begin(); terminal > m_historyLimit && it != m_order.end();) {
        if (isTerminal(m_tasks.at(it->second)->snapshot.status())) {
            LOG_TRACE("Evicting task {} from history", it->second);
            m_tasks.erase(it->second);
            it = m_order.erase(it);
            --terminal;
        } else {
            ++it;
        }
    }
}

} // namespace modelfetch::core::downloader

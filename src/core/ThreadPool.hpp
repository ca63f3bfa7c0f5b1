#pragma once

/**
 * ThreadPool.hpp
 *
 * Bounded worker pool used as the admission gate of a download batch.
 * At most workerCount() jobs run at once; the rest wait in submission order.
 */

#include <vector>
#include <algorithm>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

#include "Logger.hpp"

namespace modelfetch::core {

/**
 * ThreadPool - FIFO bounded worker pool
 *
 * Jobs are nullary callables; their result or exception travels through the
 * returned future. The destructor runs every queued job before joining, so
 * a pool scoped to one batch doubles as its completion barrier.
 */
class ThreadPool {
public:
    /**
     * @param workers Number of worker threads, at least one
     * @throws std::invalid_argument if workers is 0
     */
    explicit ThreadPool(size_t workers) {
        if (workers == 0) {
            throw std::invalid_argument("ThreadPool needs at least one worker");
        }

        m_workers.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            m_workers.emplace_back([this] { run(); });
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closing = true;
        }
        m_wakeup.notify_all();

        for (auto& worker : m_workers) {
            worker.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Queue a job behind everything submitted before it
     * @return Future for the job's result
     */
    template<typename Job>
    auto submit(Job&& job) -> std::future<std::invoke_result_t<Job>> {
        using Result = std::invoke_result_t<Job>;

        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<Job>(job));
        std::future<Result> future = packaged->get_future();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closing) {
                throw std::runtime_error("ThreadPool is shutting down");
            }
            m_queue.emplace_back([packaged]() { (*packaged)(); });
        }

        m_wakeup.notify_one();
        return future;
    }

    size_t workerCount() const {
        return m_workers.size();
    }

    /**
     * Highest number of jobs that were running at the same time
     */
    size_t peakRunning() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_peakRunning;
    }

private:
    void run() {
        std::unique_lock<std::mutex> lock(m_mutex);

        while (true) {
            m_wakeup.wait(lock, [this] { return m_closing || !m_queue.empty(); });
            if (m_queue.empty()) {
                return;
            }

            std::function<void()> job = std::move(m_queue.front());
            m_queue.pop_front();
            m_peakRunning = std::max(m_peakRunning, ++m_running);

            lock.unlock();
            try {
                job();
            } catch (const std::exception& e) {
                // packaged_task keeps job exceptions in the future; this is the wrapper failing
                LOG_ERROR("ThreadPool job failed: {}", e.what());
            }
            lock.lock();

            --m_running;
        }
    }

private:
    std::vector<std::thread> m_workers;
    std::deque<std::function<void()>> m_queue;

    mutable std::mutex m_mutex;
    std::condition_variable m_wakeup;

    bool m_closing{false};
    size_t m_running{0};
    size_t m_peakRunning{0};
};

} // namespace modelfetch::core

#include "core/ThreadPool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <vector>

namespace modelfetch::core {

TEST(ThreadPoolTest, SingleWorkerRunsJobsInSubmissionOrder) {
    std::vector<int> order;
    std::vector<std::future<void>> futures;
    {
        ThreadPool pool(1);
        for (int i = 0; i < 5; ++i) {
            futures.push_back(pool.submit([&order, i]() { order.push_back(i); }));
        }
    }

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(ThreadPoolTest, NeverRunsMoreJobsThanWorkers) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    ThreadPool pool(2);
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 6; ++i) {
        futures.push_back(pool.submit([&]() {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --running;
        }));
    }
    for (auto& future : futures) {
        future.get();
    }

    EXPECT_LE(peak.load(), 2);
    EXPECT_LE(pool.peakRunning(), 2u);
    EXPECT_EQ(pool.workerCount(), 2u);
}

TEST(ThreadPoolTest, ResultsAndExceptionsTravelThroughFutures) {
    ThreadPool pool(2);

    auto value = pool.submit([]() { return 42; });
    auto failure = pool.submit([]() -> int { throw std::runtime_error("job failed"); });

    EXPECT_EQ(value.get(), 42);
    EXPECT_THROW(failure.get(), std::runtime_error);
}

TEST(ThreadPoolTest, RejectsZeroWorkers) {
    EXPECT_THROW(ThreadPool pool(0), std::invalid_argument);
}

} // namespace modelfetch::core

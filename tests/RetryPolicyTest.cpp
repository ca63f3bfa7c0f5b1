#include "core/downloader/RetryPolicy.hpp"
#include "support/FakeClock.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace modelfetch::core::downloader {

using namespace std::chrono_literals;

class RetryPolicyTest : public ::testing::Test {
protected:
    static TransferOutcome networkError(int attempt) {
        return TransferOutcome::failure(DownloadErrorKind::Network,
                                        "connection reset (attempt " + std::to_string(attempt) + ")");
    }

    static TransferOutcome ok() {
        return TransferOutcome::completed(1024, 1024, std::string(64, 'a'));
    }

    /**
     * Attempt function failing the first @p failures calls
     */
    std::function<TransferOutcome(int)> failingTimes(int failures) {
        return [this, failures](int attempt) {
            ++calls;
            return attempt <= failures ? networkError(attempt) : ok();
        };
    }

    test::FakeClock clock;
    int calls{0};
};

TEST_F(RetryPolicyTest, SucceedsAfterFailuresWithinBudget) {
    RetryPolicy policy(3, 1000ms, clock);

    auto outcome = policy.run(failingTimes(2), {});

    EXPECT_TRUE(outcome.success());
    EXPECT_EQ(outcome.attempts, 3);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(clock.waits().size(), 2u);
}

TEST_F(RetryPolicyTest, ExhaustionKeepsLastError) {
    RetryPolicy policy(2, 1000ms, clock);

    auto outcome = policy.run(failingTimes(5), {});

    EXPECT_FALSE(outcome.success());
    EXPECT_TRUE(outcome.exhausted);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(outcome.errorMessage(), "Download failed after 3 attempts: connection reset (attempt 3)");
}

TEST_F(RetryPolicyTest, ZeroRetriesMeansOneAttempt) {
    RetryPolicy policy(0, 1000ms, clock);

    auto outcome = policy.run(failingTimes(1), {});

    EXPECT_FALSE(outcome.success());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(outcome.errorMessage(), "connection reset (attempt 1)");
    EXPECT_TRUE(clock.waits().empty());
}

TEST_F(RetryPolicyTest, TerminalErrorStopsImmediately) {
    RetryPolicy policy(5, 1000ms, clock);

    auto outcome = policy.run([this](int) {
        ++calls;
        return TransferOutcome::failure(DownloadErrorKind::HttpStatus, "HTTP 404", 404);
    }, {});

    EXPECT_FALSE(outcome.success());
    EXPECT_FALSE(outcome.exhausted);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(outcome.errorMessage(), "HTTP 404");
}

TEST_F(RetryPolicyTest, ServerErrorsAreRetried) {
    RetryPolicy policy(2, 1000ms, clock);

    auto outcome = policy.run([this](int) {
        ++calls;
        return TransferOutcome::failure(DownloadErrorKind::HttpStatus, "HTTP 503", 503);
    }, {});

    EXPECT_EQ(calls, 3);
    EXPECT_NE(outcome.errorMessage().find("HTTP 503"), std::string::npos);
}

TEST_F(RetryPolicyTest, FilesystemErrorIsTerminal) {
    RetryPolicy policy(3, 1000ms, clock);

    auto outcome = policy.run([this](int) {
        ++calls;
        return TransferOutcome::failure(DownloadErrorKind::Filesystem,
                                        "filesystem error: No space left on device");
    }, {});

    EXPECT_EQ(calls, 1);
    EXPECT_NE(outcome.errorMessage().find("No space left on device"), std::string::npos);
}

TEST_F(RetryPolicyTest, WaitsTheConfiguredDelay) {
    RetryPolicy policy(2, 1500ms, clock);

    policy.run(failingTimes(2), {});

    auto waits = clock.waits();
    ASSERT_EQ(waits.size(), 2u);
    for (auto wait : waits) {
        // The deadline is set right after the failed attempt returns
        EXPECT_LE(wait, std::chrono::milliseconds(1500));
        EXPECT_GT(wait, std::chrono::milliseconds(1400));
    }
}

TEST_F(RetryPolicyTest, InterruptDuringWaitStops) {
    RetryPolicy policy(5, 1000ms, clock);
    bool stop = false;

    auto outcome = policy.run([this, &stop](int attempt) {
        ++calls;
        stop = true;
        return networkError(attempt);
    }, [&stop]() { return stop; });

    EXPECT_TRUE(outcome.interrupted());
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryPolicyTest, InterruptedAttemptIsNotRetried) {
    RetryPolicy policy(5, 1000ms, clock);

    auto outcome = policy.run([this](int) {
        ++calls;
        return TransferOutcome::failure(DownloadErrorKind::Interrupted, "interrupted");
    }, {});

    EXPECT_TRUE(outcome.interrupted());
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryPolicyTest, RetryCallbackSeesEachFailure) {
    RetryPolicy policy(3, 10ms, clock);
    std::vector<int> retried;

    policy.run(failingTimes(2), {}, [&retried](int attempt, const TransferOutcome& outcome) {
        EXPECT_FALSE(outcome.success);
        retried.push_back(attempt);
    });

    EXPECT_EQ(retried, (std::vector<int>{1, 2}));
}

TEST_F(RetryPolicyTest, NegativeRetriesTreatedAsZero) {
    RetryPolicy policy(-3, 10ms, clock);
    EXPECT_EQ(policy.maxAttempts(), 1);
}

} // namespace modelfetch::core::downloader

#pragma once

/**
 * RetryPolicy.hpp
 *
 * Bounded retries with a fixed delay, as an explicit state machine over an
 * injected clock.
 */

#include "TransferUnit.hpp"
#include "../Clock.hpp"

#include <functional>
#include <chrono>
#include <string>

namespace modelfetch::core::downloader {

/**
 * Final outcome of a retried operation
 */
struct RetryOutcome {
    TransferOutcome last;
    int attempts{0};

    // Stopped because every allowed attempt failed with a retryable error
    bool exhausted{false};

    bool success() const { return last.success; }
    bool interrupted() const { return last.errorKind == DownloadErrorKind::Interrupted; }

    /**
     * Error text for the caller; keeps the last underlying message
     */
    std::string errorMessage() const;
};

/**
 * RetryPolicy
 *
 *   Attempting --success--------------------> Succeeded
 *   Attempting --terminal error-------------> Failed
 *   Attempting --retryable, attempts left---> Waiting(until now + delay)
 *   Attempting --retryable, none left-------> Failed (exhausted)
 *   Attempting --interrupted----------------> Interrupted
 *   Waiting    --deadline reached-----------> Attempting
 *   Waiting    --interrupted----------------> Interrupted
 */
class RetryPolicy {
public:
    enum class State {
        Attempting,
        Waiting,
        Succeeded,
        Failed,
        Interrupted
    };

    using AttemptFn = std::function<TransferOutcome(int attempt)>;
    using RetryFn = std::function<void(int failedAttempt, const TransferOutcome& outcome)>;

    /**
     * @param retries Attempts beyond the first (negative is treated as 0)
     * @param retryDelay Wait between attempts
     * @param clock Time source for the waits
     */
    RetryPolicy(int retries, std::chrono::milliseconds retryDelay, Clock& clock);

    /**
     * Run @p attemptFn until success, a terminal error, exhaustion or
     * interruption. Attempts are numbered from 1.
     * @param interrupted Checked before every attempt and during waits
     * @param onRetry Called after each failed attempt that will be retried
     */
    RetryOutcome run(const AttemptFn& attemptFn,
                     const std::function<bool()>& interrupted,
                     const RetryFn& onRetry = {});

    int maxAttempts() const { return m_retries + 1; }

private:
    int m_retries;
    std::chrono::milliseconds m_retryDelay;
    Clock& m_clock;
};

} // namespace modelfetch::core::downloader

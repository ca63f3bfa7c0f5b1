/**
 * RetryPolicy.cpp
 */

#include "RetryPolicy.hpp"
#include "../Logger.hpp"

#include <algorithm>

namespace modelfetch::core::downloader {

std::string RetryOutcome::errorMessage() const {
    if (last.success) {
        return "";
    }
    if (exhausted && attempts > 1) {
        return "Download failed after " + std::to_string(attempts) + " attempts: " + last.message;
    }
    return last.message;
}

RetryPolicy::RetryPolicy(int retries, std::chrono::milliseconds retryDelay, Clock& clock)
    : m_retries(std::max(0, retries))
    , m_retryDelay(std::max(std::chrono::milliseconds(0), retryDelay))
    , m_clock(clock) {
}

RetryOutcome RetryPolicy::run(const AttemptFn& attemptFn,
                              const std::function<bool()>& interrupted,
                              const RetryFn& onRetry) {
    RetryOutcome outcome;
    State state = State::Attempting;
    Clock::TimePoint retryAt{};

    while (true) {
        switch (state) {
            case State::Attempting: {
                if (interrupted && interrupted()) {
                    outcome.last = TransferOutcome::failure(DownloadErrorKind::Interrupted, "interrupted");
                    state = State::Interrupted;
                    break;
                }

                ++outcome.attempts;
                outcome.last = attemptFn(outcome.attempts);

                if (outcome.last.success) {
                    state = State::Succeeded;
                } else if (outcome.last.errorKind == DownloadErrorKind::Interrupted) {
                    state = State::Interrupted;
                } else if (!outcome.last.retryable()) {
                    state = State::Failed;
                } else if (outcome.attempts >= maxAttempts()) {
                    outcome.exhausted = true;
                    state = State::Failed;
                } else {
                    LOG_WARN("Attempt {}/{} failed ({}), retrying in {} ms",
                             outcome.attempts, maxAttempts(), outcome.last.message, m_retryDelay.count());
                    if (onRetry) {
                        onRetry(outcome.attempts, outcome.last);
                    }
                    retryAt = m_clock.now() + m_retryDelay;
                    state = State::Waiting;
                }
                break;
            }

            case State::Waiting:
                if (m_clock.waitUntil(retryAt, interrupted)) {
                    state = State::Attempting;
                } else {
                    outcome.last = TransferOutcome::failure(DownloadErrorKind::Interrupted, "interrupted");
                    state = State::Interrupted;
                }
                break;

            case State::Succeeded:
            case State::Failed:
            case State::Interrupted:
                return outcome;
        }
    }
}

} // namespace modelfetch::core::downloader

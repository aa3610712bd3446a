/**
 * @file Backoff.cpp
 * @brief Bounded exponential backoff implementation
 */

#include "Backoff.h"
#include "LogLevel.h"

#include <algorithm>

std::chrono::milliseconds BackoffPolicy::delayAfter(int failedAttempt) const {
    double delay = static_cast<double>(initialDelay.count());
    for (int i = 1; i < failedAttempt; i++) {
        delay *= multiplier;
        if (delay >= static_cast<double>(maxDelay.count())) break;
    }
    auto ms = static_cast<std::chrono::milliseconds::rep>(delay);
    return std::min(std::chrono::milliseconds(ms), maxDelay);
}

Status retryWithBackoff(const BackoffPolicy& policy,
                        const CancelToken& cancel,
                        const char* what,
                        const std::function<Status()>& op,
                        const RetryPredicate& shouldRetry) {
    const int attempts = std::max(policy.maxAttempts, 1);
    Status status;

    for (int attempt = 1; attempt <= attempts; attempt++) {
        if (cancel.isCancelled()) {
            return Status::error(ErrorCode::CANCELLED, what);
        }

        status = op();
        if (status.ok()) {
            if (attempt > 1) {
                LOG_DEBUG("[Retry] " << what << " succeeded on attempt " << attempt);
            }
            return status;
        }

        bool retryable = shouldRetry ? shouldRetry(status) : isTransient(status.code);
        if (!retryable || status.code == ErrorCode::CANCELLED) {
            return status;
        }

        if (attempt == attempts) break;

        auto delay = policy.delayAfter(attempt);
        LOG_WARN("[Retry] " << what << " failed (" << status << "), attempt "
                 << attempt << "/" << attempts << ", retrying in "
                 << delay.count() << "ms");

        if (!cancel.sleepFor(delay)) {
            return Status::error(ErrorCode::CANCELLED, what);
        }
    }

    LOG_WARN("[Retry] " << what << " giving up after " << attempts
             << " attempts: " << status);
    return status;
}

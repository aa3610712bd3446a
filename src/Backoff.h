/**
 * @file Backoff.h
 * @brief Bounded exponential backoff shared by login, playlist fetch,
 *        track download and feedback submission
 */

#ifndef STATIONPLAY_BACKOFF_H
#define STATIONPLAY_BACKOFF_H

#include "CancelToken.h"
#include "Status.h"

#include <chrono>
#include <functional>

struct BackoffPolicy {
    int maxAttempts = 3;                            // Total tries, including the first
    std::chrono::milliseconds initialDelay{500};
    std::chrono::milliseconds maxDelay{8000};
    double multiplier = 2.0;

    /**
     * @brief Delay to wait after the given failed attempt (1-based)
     */
    std::chrono::milliseconds delayAfter(int failedAttempt) const;
};

using RetryPredicate = std::function<bool(const Status&)>;

/**
 * @brief Run op until it succeeds, fails with a non-retryable status,
 *        runs out of attempts, or cancel is triggered
 *
 * @param what Short label for log lines ("playlist", "download ...")
 * @param shouldRetry Classification; defaults to isTransient(code)
 * @return Last status from op, or CANCELLED if cancelled while waiting
 */
Status retryWithBackoff(const BackoffPolicy& policy,
                        const CancelToken& cancel,
                        const char* what,
                        const std::function<Status()>& op,
                        const RetryPredicate& shouldRetry = RetryPredicate());

#endif // STATIONPLAY_BACKOFF_H

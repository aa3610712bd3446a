/**
 * @file CancelToken.h
 * @brief Cooperative cancellation flag shared between threads
 *
 * Copies share the same state: cancelling any copy cancels them all.
 * Workers check isCancelled() at every suspend point (between socket
 * reads, before cache writes, during backoff sleeps). Nothing is ever
 * interrupted forcibly.
 */

#ifndef STATIONPLAY_CANCEL_TOKEN_H
#define STATIONPLAY_CANCEL_TOKEN_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

class CancelToken {
public:
    CancelToken();

    void cancel();
    bool isCancelled() const;

    /**
     * @brief Sleep for the given duration unless cancelled first
     * @return true if the full duration elapsed, false if cancelled
     */
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };
    std::shared_ptr<State> m_state;
};

#endif // STATIONPLAY_CANCEL_TOKEN_H

/**
 * @file FeedbackWorker.h
 * @brief Submits ratings and tired marks to the service in issue order
 *
 * Feedback is best-effort: the engine applies it locally first and never
 * waits for the service. Requests run one at a time on a dedicated
 * thread, so two ratings of the same track reach the service in the
 * order the user gave them.
 */

#ifndef STATIONPLAY_FEEDBACK_WORKER_H
#define STATIONPLAY_FEEDBACK_WORKER_H

#include "Backoff.h"
#include "CancelToken.h"
#include "SessionManager.h"
#include "Status.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

class FeedbackWorker {
public:
    using Request = std::function<Status(const SessionToken& session)>;

    FeedbackWorker(SessionManager& session, BackoffPolicy retry);
    ~FeedbackWorker();

    // Non-copyable
    FeedbackWorker(const FeedbackWorker&) = delete;
    FeedbackWorker& operator=(const FeedbackWorker&) = delete;

    void start();
    // Drops requests not yet started; waits for the one in flight
    void stop();

    void submit(std::string description, Request request);

    // Block until the queue is empty and nothing is in flight
    void waitIdle();

    size_t failures() const;

private:
    struct Item {
        std::string description;
        Request request;
    };

    void run();

    SessionManager& m_session;
    BackoffPolicy m_retry;
    CancelToken m_cancel;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    std::deque<Item> m_queue;
    bool m_running = false;
    bool m_busy = false;
    size_t m_failures = 0;

    std::thread m_thread;
};

#endif // STATIONPLAY_FEEDBACK_WORKER_H

/**
 * @file FeedbackWorker.cpp
 * @brief Ordered, best-effort feedback submission
 */

#include "FeedbackWorker.h"
#include "LogLevel.h"

FeedbackWorker::FeedbackWorker(SessionManager& session, BackoffPolicy retry)
    : m_session(session)
    , m_retry(retry)
{
}

FeedbackWorker::~FeedbackWorker() {
    stop();
}

void FeedbackWorker::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) return;
    m_running = true;
    m_thread = std::thread(&FeedbackWorker::run, this);
}

void FeedbackWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
        if (!m_queue.empty()) {
            LOG_DEBUG("[Feedback] Dropping " << m_queue.size() << " unsent request(s)");
            m_queue.clear();
        }
    }
    m_cancel.cancel();
    m_cv.notify_all();
    if (m_thread.joinable()) m_thread.join();
    m_idleCv.notify_all();
}

void FeedbackWorker::submit(std::string description, Request request) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            LOG_WARN("[Feedback] Not running, dropping: " << description);
            return;
        }
        m_queue.push_back(Item{std::move(description), std::move(request)});
    }
    m_cv.notify_one();
}

void FeedbackWorker::waitIdle() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] { return (m_queue.empty() && !m_busy) || !m_running; });
}

size_t FeedbackWorker::failures() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failures;
}

void FeedbackWorker::run() {
    while (true) {
        Item item;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_queue.empty() || !m_running; });
            if (!m_running) break;
            item = std::move(m_queue.front());
            m_queue.pop_front();
            m_busy = true;
        }

        Status status = retryWithBackoff(m_retry, m_cancel, item.description.c_str(), [&]() {
            return m_session.withSession(item.request);
        });

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
            if (status.ok()) {
                LOG_DEBUG("[Feedback] Sent: " << item.description);
            } else {
                m_failures++;
                LOG_WARN("[Feedback] Failed: " << item.description << " (" << status << ")");
            }
        }
        m_idleCv.notify_all();
    }
}

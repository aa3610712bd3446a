/**
 * @file CancelToken.cpp
 * @brief Cooperative cancellation flag implementation
 */

#include "CancelToken.h"

CancelToken::CancelToken()
    : m_state(std::make_shared<State>())
{
}

void CancelToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->cancelled.store(true, std::memory_order_release);
    }
    m_state->cv.notify_all();
}

bool CancelToken::isCancelled() const {
    return m_state->cancelled.load(std::memory_order_acquire);
}

bool CancelToken::sleepFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    return !m_state->cv.wait_for(lock, duration, [this] {
        return m_state->cancelled.load(std::memory_order_acquire);
    });
}

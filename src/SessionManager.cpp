/**
 * @file SessionManager.cpp
 * @brief Session lifecycle implementation
 */

#include "SessionManager.h"

SessionManager::SessionManager(ServiceClient& client, CredentialStore& credentials,
                               BackoffPolicy authPolicy)
    : m_client(client)
    , m_credentials(credentials)
    , m_authPolicy(authPolicy)
{
}

SessionManager::~SessionManager() {
    shutdown();
}

const char* SessionManager::stateName(State state) {
    switch (state) {
        case State::UNAUTHENTICATED: return "unauthenticated";
        case State::AUTHENTICATING:  return "authenticating";
        case State::VALID:           return "connected";
        case State::EXPIRED:         return "expired";
        case State::FAILED:          return "login failed";
    }
    return "unknown";
}

// ============================================
// currentSession
// ============================================

Status SessionManager::currentSession(SessionHandle& out) {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (true) {
        switch (m_state) {
            case State::VALID:
                out = m_session;
                return Status::success();

            case State::FAILED:
                return m_lastError.ok()
                    ? Status::error(ErrorCode::INVALID_CREDENTIALS, "login failed")
                    : m_lastError;

            case State::AUTHENTICATING: {
                uint64_t waitingFor = m_generation;
                m_cv.wait(lock, [this] { return m_state != State::AUTHENTICATING; });
                if (m_state == State::VALID || m_state == State::FAILED) continue;
                // The login we waited on failed transiently: share its outcome
                if (m_generation == waitingFor && !m_lastError.ok()) return m_lastError;
                continue;
            }

            case State::UNAUTHENTICATED:
            case State::EXPIRED: {
                m_state = State::AUTHENTICATING;
                m_credentialsChanged = false;
                lock.unlock();
                notify(State::AUTHENTICATING, Status::success());

                SessionToken token;
                Status status = login(token);

                lock.lock();
                State next;
                bool retry = false;
                if (status.ok()) {
                    m_generation++;
                    m_session.token = token;
                    m_session.generation = m_generation;
                    m_everValid = true;
                    m_lastError = Status::success();
                    next = State::VALID;
                } else if (status.code == ErrorCode::INVALID_CREDENTIALS && m_credentialsChanged) {
                    // Rejected credentials were replaced during the attempt
                    LOG_INFO("[Session] Credentials changed during login, retrying");
                    m_lastError = Status::success();
                    next = State::UNAUTHENTICATED;
                    retry = true;
                } else if (status.code == ErrorCode::INVALID_CREDENTIALS) {
                    m_lastError = status;
                    next = State::FAILED;
                } else {
                    m_lastError = status;
                    next = m_everValid ? State::EXPIRED : State::UNAUTHENTICATED;
                }
                m_state = next;
                m_cv.notify_all();
                lock.unlock();
                notify(next, status);

                if (!status.ok() && !retry) return status;
                lock.lock();
                continue;
            }
        }
    }
}

Status SessionManager::login(SessionToken& token) {
    auto credentials = m_credentials.load();
    if (!credentials || credentials->empty()) {
        LOG_ERROR("[Session] No credentials available");
        return Status::error(ErrorCode::INVALID_CREDENTIALS, "no credentials available");
    }

    LOG_INFO("[Session] Logging in as " << credentials->username);

    Status status = retryWithBackoff(m_authPolicy, m_cancel, "login", [&]() {
        return m_client.authenticate(*credentials, token);
    });

    if (status.ok()) {
        LOG_INFO("[Session] Logged in");
    } else if (status.code == ErrorCode::INVALID_CREDENTIALS) {
        LOG_ERROR("[Session] Credentials rejected: " << status);
    } else {
        LOG_WARN("[Session] Login failed: " << status);
    }
    return status;
}

// ============================================
// Expiry / credentials
// ============================================

void SessionManager::reportExpired(const SessionHandle& handle) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != State::VALID || handle.generation != m_generation) return;
        m_state = State::EXPIRED;
        m_session = SessionHandle();
    }
    LOG_DEBUG("[Session] Session generation " << handle.generation << " expired");
    notify(State::EXPIRED, Status::error(ErrorCode::SESSION_EXPIRED, "session expired"));
}

void SessionManager::setCredentials(const Credentials& credentials) {
    m_credentials.save(credentials);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == State::AUTHENTICATING) {
            // The login in flight uses the old ones; retried if they are rejected
            m_credentialsChanged = true;
            return;
        }
        m_state = State::UNAUTHENTICATED;
        m_session = SessionHandle();
        m_lastError = Status::success();
    }
    notify(State::UNAUTHENTICATED, Status::success());
}

void SessionManager::logout() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != State::VALID && m_state != State::EXPIRED) return;
        m_state = State::UNAUTHENTICATED;
        m_session = SessionHandle();
    }
    notify(State::UNAUTHENTICATED, Status::success());
}

void SessionManager::shutdown() {
    m_cancel.cancel();
}

SessionManager::State SessionManager::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

Status SessionManager::lastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

uint64_t SessionManager::generation() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_generation;
}

// ============================================
// Listener
// ============================================

void SessionManager::onStateChange(StateCallback cb) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_stateCb = std::move(cb);
}

void SessionManager::notify(State state, const Status& status) {
    StateCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        cb = m_stateCb;
    }
    if (cb) cb(state, status);
}

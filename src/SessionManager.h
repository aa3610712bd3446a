/**
 * @file SessionManager.h
 * @brief Owns the authenticated session and its lifecycle
 *
 * State machine:
 *   UNAUTHENTICATED -> AUTHENTICATING -> VALID -> EXPIRED -> AUTHENTICATING
 *                                     \-> FAILED (credentials rejected)
 *
 * The session is never shared as a global: components receive a copy of
 * the current SessionHandle for the duration of one call and report
 * expiry back here. Concurrent callers during a login wait for its
 * outcome instead of starting their own.
 */

#ifndef STATIONPLAY_SESSION_MANAGER_H
#define STATIONPLAY_SESSION_MANAGER_H

#include "Backoff.h"
#include "CancelToken.h"
#include "CredentialStore.h"
#include "LogLevel.h"
#include "Models.h"
#include "ServiceClient.h"
#include "Status.h"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>

class SessionManager {
public:
    enum class State { UNAUTHENTICATED, AUTHENTICATING, VALID, EXPIRED, FAILED };

    using StateCallback = std::function<void(State state, const Status& lastError)>;

    SessionManager(ServiceClient& client, CredentialStore& credentials,
                   BackoffPolicy authPolicy);
    ~SessionManager();

    // Non-copyable
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Get a usable session, logging in first if needed
     *
     * Returns immediately when VALID, fails fast with INVALID_CREDENTIALS
     * when FAILED, and otherwise blocks the calling thread until the login
     * in progress (its own or another caller's) completes.
     */
    Status currentSession(SessionHandle& out);

    /**
     * @brief Report that the service rejected handle's token as expired
     *
     * Ignored if a newer login already replaced that token.
     */
    void reportExpired(const SessionHandle& handle);

    /**
     * @brief Run fn(token); on session expiry re-login and retry once
     */
    template <typename Fn>
    Status withSession(Fn&& fn) {
        SessionHandle handle;
        Status status = currentSession(handle);
        if (!status.ok()) return status;

        status = fn(static_cast<const SessionToken&>(handle.token));
        if (!isSessionExpiry(status.code)) return status;

        LOG_INFO("[Session] Session expired, re-authenticating");
        reportExpired(handle);

        status = currentSession(handle);
        if (!status.ok()) return status;
        return fn(static_cast<const SessionToken&>(handle.token));
    }

    // New credentials from the user; leaves FAILED. During a login they
    // are tried as soon as the old ones are rejected.
    void setCredentials(const Credentials& credentials);

    // Drop the session (next call logs in again)
    void logout();

    // Abort backoff waits of a login in progress (process shutdown)
    void shutdown();

    State state() const;
    Status lastError() const;
    uint64_t generation() const;

    void onStateChange(StateCallback cb);

    static const char* stateName(State state);

private:
    // Performs the login; called without the mutex held
    Status login(SessionToken& token);
    void notify(State state, const Status& status);

    ServiceClient& m_client;
    CredentialStore& m_credentials;
    BackoffPolicy m_authPolicy;
    CancelToken m_cancel;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    State m_state = State::UNAUTHENTICATED;
    SessionHandle m_session;
    uint64_t m_generation = 0;
    bool m_everValid = false;
    bool m_credentialsChanged = false;  // setCredentials() during a login
    Status m_lastError;

    std::mutex m_callbackMutex;
    StateCallback m_stateCb;
};

#endif // STATIONPLAY_SESSION_MANAGER_H

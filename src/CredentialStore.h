/**
 * @file CredentialStore.h
 * @brief Source of saved login secrets
 */

#ifndef STATIONPLAY_CREDENTIAL_STORE_H
#define STATIONPLAY_CREDENTIAL_STORE_H

#include "Models.h"

#include <mutex>
#include <optional>
#include <utility>

class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    virtual std::optional<Credentials> load() = 0;
    virtual void save(const Credentials& credentials) = 0;
};

// Keeps credentials for the lifetime of the process (from the command line
// or the environment). Nothing is written to disk.
class MemoryCredentialStore : public CredentialStore {
public:
    MemoryCredentialStore() = default;
    explicit MemoryCredentialStore(Credentials credentials)
        : m_credentials(std::move(credentials)) {}

    std::optional<Credentials> load() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_credentials;
    }

    void save(const Credentials& credentials) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_credentials = credentials;
    }

private:
    std::mutex m_mutex;
    std::optional<Credentials> m_credentials;
};

#endif // STATIONPLAY_CREDENTIAL_STORE_H

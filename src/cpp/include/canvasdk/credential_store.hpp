/**
 * @file credential_store.hpp
 * @brief In-memory OAuth credential holder for CanvaSDK C++
 */

#ifndef CANVASDK_CREDENTIAL_STORE_HPP
#define CANVASDK_CREDENTIAL_STORE_HPP

#include "types.hpp"
#include <mutex>
#include <optional>

namespace canvasdk {

/**
 * Single source of truth for the current credential.
 *
 * Every operation holds the internal lock for its whole duration and
 * performs no I/O.
 */
class CredentialStore {
public:
    CredentialStore() = default;
    CredentialStore(const CredentialStore&) = delete;
    CredentialStore& operator=(const CredentialStore&) = delete;

    /**
     * Get the current credential
     * @return Credential or nullopt when not authenticated
     */
    std::optional<Credential> get() const;

    /**
     * Replace the current credential
     * @param credential New credential
     */
    void set(const Credential& credential);

    /**
     * Drop the current credential (local only, no revocation)
     */
    void clear();

    bool is_authenticated() const;

private:
    std::optional<Credential> credential_;
    mutable std::mutex mutex_;
};

} // namespace canvasdk

#endif // CANVASDK_CREDENTIAL_STORE_HPP

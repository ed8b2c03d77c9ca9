/**
 * @file credential_store.cpp
 * @brief Credential store implementation for CanvaSDK C++
 */

#include "canvasdk/credential_store.hpp"

namespace canvasdk {

std::optional<Credential> CredentialStore::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credential_;
}

void CredentialStore::set(const Credential& credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    credential_ = credential;
}

void CredentialStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    credential_.reset();
}

bool CredentialStore::is_authenticated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credential_.has_value();
}

} // namespace canvasdk

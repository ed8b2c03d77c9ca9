/**
 * @file token_manager.hpp
 * @brief Access token lifecycle with single-flight refresh for CanvaSDK C++
 */

#ifndef CANVASDK_TOKEN_MANAGER_HPP
#define CANVASDK_TOKEN_MANAGER_HPP

#include "types.hpp"
#include "auth.hpp"
#include "cancellation.hpp"
#include "credential_store.hpp"
#include <future>
#include <memory>
#include <mutex>
#include <optional>

namespace canvasdk {

/**
 * Hands out non-expired access tokens to concurrent callers.
 *
 * At most one refresh request is in flight at a time; callers that need a
 * refresh while one is running wait for its outcome and share it, success
 * or error. An invalid_grant outcome clears the store and surfaces as
 * AuthError(refresh_failed); transient outcomes leave the store untouched.
 */
class TokenManager {
public:
    /**
     * Create a token manager
     * @param store Credential store
     * @param oauth_client Token endpoint client
     * @param safety_margin Refresh when the token expires within this margin
     * @param clock Wall clock (defaults to system_clock::now)
     * @param steady_clock Monotonic clock for caller deadlines (defaults to steady_clock::now)
     */
    TokenManager(
        std::shared_ptr<CredentialStore> store,
        std::shared_ptr<OAuthClient> oauth_client,
        std::chrono::seconds safety_margin = std::chrono::seconds(TOKEN_SAFETY_MARGIN_SECONDS),
        SystemClock clock = nullptr,
        SteadyClock steady_clock = nullptr
    );

    TokenManager(const TokenManager&) = delete;
    TokenManager& operator=(const TokenManager&) = delete;

    /**
     * Get an access token that is valid for at least the safety margin
     * @param ctx Cancellation and deadline for the refresh wait
     * @return Access token
     */
    std::string get_valid_token(const CallContext& ctx = {});

    /**
     * Refresh after the provider rejected `stale_access_token`.
     * Returns the stored token without a network call if someone else
     * already replaced it.
     * @param stale_access_token Token that received a 401
     * @param ctx Cancellation and deadline for the refresh wait
     * @return Access token
     */
    std::string force_refresh(const std::string& stale_access_token, const CallContext& ctx = {});

    /**
     * Refresh unconditionally (joins a refresh already in flight)
     * @param ctx Cancellation and deadline for the refresh wait
     * @return New credential
     */
    Credential refresh(const CallContext& ctx = {});

    std::chrono::seconds safety_margin() const { return safety_margin_; }

private:
    enum class RefreshReason {
        Expiring,
        Rejected,
        Explicit
    };

    Credential run_single_flight(RefreshReason reason, const std::string& stale_access_token,
                                 const CallContext& ctx);
    Credential perform_refresh();
    Credential await_refresh(const std::shared_future<Credential>& refresh, const CallContext& ctx);

    std::shared_ptr<CredentialStore> store_;
    std::shared_ptr<OAuthClient> oauth_client_;
    std::chrono::seconds safety_margin_;
    SystemClock clock_;
    SteadyClock steady_clock_;
    std::optional<std::shared_future<Credential>> in_flight_;
    std::mutex mutex_;
};

} // namespace canvasdk

#endif // CANVASDK_TOKEN_MANAGER_HPP

/**
 * @file token_manager.cpp
 * @brief Token manager implementation for CanvaSDK C++
 */

#include "canvasdk/token_manager.hpp"
#include "canvasdk/errors.hpp"
#include "canvasdk/logging.hpp"
#include <algorithm>

namespace canvasdk {

static constexpr std::chrono::milliseconds REFRESH_WAIT_SLICE{50};

static Timestamp system_now() {
    return std::chrono::system_clock::now();
}

TokenManager::TokenManager(
    std::shared_ptr<CredentialStore> store,
    std::shared_ptr<OAuthClient> oauth_client,
    std::chrono::seconds safety_margin,
    SystemClock clock,
    SteadyClock steady_clock
) : store_(std::move(store)),
    oauth_client_(std::move(oauth_client)),
    safety_margin_(safety_margin),
    clock_(clock ? std::move(clock) : SystemClock(&system_now)),
    steady_clock_(steady_clock ? std::move(steady_clock) : SteadyClock(&steady_now)) {
}

std::string TokenManager::get_valid_token(const CallContext& ctx) {
    ctx.throw_if_cancelled();

    auto current = store_->get();
    if (!current.has_value()) {
        throw AuthError(AuthErrorKind::Unauthenticated,
                        "Not authenticated; complete the OAuth authorization flow first");
    }
    if (!current->expires_within(safety_margin_, clock_())) {
        return current->access_token;
    }
    return run_single_flight(RefreshReason::Expiring, "", ctx).access_token;
}

std::string TokenManager::force_refresh(const std::string& stale_access_token, const CallContext& ctx) {
    ctx.throw_if_cancelled();
    return run_single_flight(RefreshReason::Rejected, stale_access_token, ctx).access_token;
}

Credential TokenManager::refresh(const CallContext& ctx) {
    ctx.throw_if_cancelled();
    return run_single_flight(RefreshReason::Explicit, "", ctx);
}

Credential TokenManager::run_single_flight(RefreshReason reason, const std::string& stale_access_token,
                                           const CallContext& ctx) {
    std::promise<Credential> promise;
    std::shared_future<Credential> refresh;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_.has_value()) {
            refresh = *in_flight_;
        } else {
            // Re-check under the lock: a refresh may have completed since the caller looked
            auto current = store_->get();
            if (!current.has_value()) {
                throw AuthError(AuthErrorKind::Unauthenticated,
                                "Not authenticated; complete the OAuth authorization flow first");
            }
            if (reason == RefreshReason::Expiring &&
                !current->expires_within(safety_margin_, clock_())) {
                return *current;
            }
            if (reason == RefreshReason::Rejected && current->access_token != stale_access_token) {
                return *current;
            }
            refresh = promise.get_future().share();
            in_flight_ = refresh;
            leader = true;
        }
    }

    if (leader) {
        try {
            promise.set_value(perform_refresh());
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.reset();
    }

    return await_refresh(refresh, ctx);
}

Credential TokenManager::perform_refresh() {
    auto current = store_->get();
    if (!current.has_value()) {
        throw AuthError(AuthErrorKind::Unauthenticated,
                        "Not authenticated; complete the OAuth authorization flow first");
    }

    logger()->debug("Refreshing access token (expires {})", format_timestamp(current->expires_at));
    try {
        Credential fresh = oauth_client_->refresh(*current);
        store_->set(fresh);
        return fresh;
    } catch (const AuthError& e) {
        if (e.kind() != AuthErrorKind::InvalidGrant) {
            throw;
        }
        store_->clear();
        logger()->warn("Refresh token rejected, credentials cleared: {}", e.what());
        throw AuthError(AuthErrorKind::RefreshFailed, std::string("Token refresh failed: ") + e.what());
    } catch (const TransientNetworkError& e) {
        logger()->warn("Token refresh failed transiently, keeping credentials: {}", e.what());
        throw;
    }
}

Credential TokenManager::await_refresh(const std::shared_future<Credential>& refresh,
                                       const CallContext& ctx) {
    while (true) {
        ctx.throw_if_cancelled();

        auto slice = REFRESH_WAIT_SLICE;
        if (auto remaining = ctx.remaining(steady_clock_())) {
            if (remaining->count() == 0) {
                throw TimeoutError();
            }
            slice = std::min(slice, *remaining);
        }

        if (refresh.wait_for(slice) == std::future_status::ready) {
            return refresh.get();
        }
    }
}

} // namespace canvasdk

/**
 * @file gateway.hpp
 * @brief Authenticated, retrying HTTP gateway for CanvaSDK C++
 */

#ifndef CANVASDK_GATEWAY_HPP
#define CANVASDK_GATEWAY_HPP

#include "types.hpp"
#include "cancellation.hpp"
#include "token_manager.hpp"
#include "transport.hpp"
#include <memory>
#include <mutex>
#include <random>

namespace canvasdk {

/**
 * Retry limits and backoff shape
 */
struct RetryPolicy {
    int max_rate_limit_retries = 3;
    int max_transient_retries = 3;
    std::chrono::milliseconds backoff_base{1000};
    double backoff_factor = 2.0;
    std::chrono::milliseconds backoff_cap{30000};
};

/**
 * Gateway options
 */
struct GatewayOptions {
    std::string api_base = CANVA_API_BASE;
    std::chrono::milliseconds request_timeout{30000};
    RetryPolicy retry;
};

/**
 * Issues API requests with a bearer token from the TokenManager.
 *
 * 401 refreshes once and retries once; 429 waits for Retry-After (or the
 * backoff delay) up to max_rate_limit_retries; 5xx and transport failures
 * back off exponentially with jitter up to max_transient_retries. Other
 * 4xx responses throw ValidationError immediately.
 */
class HttpGateway {
public:
    /**
     * Create a gateway
     * @param transport HTTP transport
     * @param token_manager Source of bearer tokens
     * @param options Base URL, timeout and retry policy
     * @param sleep Wait function for backoff (defaults to interruptible_sleep)
     * @param clock Monotonic clock (defaults to steady_clock::now)
     */
    HttpGateway(
        std::shared_ptr<HttpTransport> transport,
        std::shared_ptr<TokenManager> token_manager,
        GatewayOptions options = {},
        SleepFunction sleep = nullptr,
        SteadyClock clock = nullptr
    );

    /**
     * Execute a request
     * @param request API request relative to the API base
     * @param ctx Cancellation and deadline
     * @return Parsed JSON body ({} for an empty body)
     */
    json execute(const ApiRequest& request, const CallContext& ctx = {});

    /**
     * Current advisory rate limit state
     */
    RateLimitState rate_limit_state() const;

    /**
     * Jittered exponential delay for the given zero-based retry
     */
    std::chrono::milliseconds backoff_delay(int retry);

    const GatewayOptions& options() const { return options_; }

private:
    HttpRequest build_request(const ApiRequest& request, const std::string& access_token) const;
    void wait(std::chrono::milliseconds duration, const CallContext& ctx);
    void wait_for_rate_limit(const CallContext& ctx);
    void record_rate_limit(std::chrono::milliseconds retry_after);
    [[noreturn]] void raise_client_error(const ApiRequest& request, const HttpResponse& response) const;

    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<TokenManager> token_manager_;
    GatewayOptions options_;
    SleepFunction sleep_;
    SteadyClock clock_;

    RateLimitState rate_limit_;
    mutable std::mutex rate_limit_mutex_;

    std::mt19937 rng_;
    std::mutex rng_mutex_;
};

/**
 * Parse a Retry-After header given in seconds
 * @param value Header value
 * @return Delay, or nullopt for HTTP-date or malformed values
 */
std::optional<std::chrono::milliseconds> parse_retry_after(const std::string& value);

} // namespace canvasdk

#endif // CANVASDK_GATEWAY_HPP

/**
 * @file gateway.cpp
 * @brief HTTP gateway implementation for CanvaSDK C++
 */

#include "canvasdk/gateway.hpp"
#include "canvasdk/errors.hpp"
#include "canvasdk/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace canvasdk {

std::optional<std::chrono::milliseconds> parse_retry_after(const std::string& value) {
    size_t start = value.find_first_not_of(" \t");
    size_t end = value.find_last_not_of(" \t");
    if (start == std::string::npos) {
        return std::nullopt;
    }
    std::string trimmed = value.substr(start, end - start + 1);
    if (trimmed.size() > 9 ||
        !std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(std::stoll(trimmed) * 1000);
}

HttpGateway::HttpGateway(
    std::shared_ptr<HttpTransport> transport,
    std::shared_ptr<TokenManager> token_manager,
    GatewayOptions options,
    SleepFunction sleep,
    SteadyClock clock
) : transport_(std::move(transport)),
    token_manager_(std::move(token_manager)),
    options_(std::move(options)),
    sleep_(sleep ? std::move(sleep) : SleepFunction(&interruptible_sleep)),
    clock_(clock ? std::move(clock) : SteadyClock(&steady_now)),
    rng_(std::random_device{}()) {
}

RateLimitState HttpGateway::rate_limit_state() const {
    std::lock_guard<std::mutex> lock(rate_limit_mutex_);
    return rate_limit_;
}

std::chrono::milliseconds HttpGateway::backoff_delay(int retry) {
    const RetryPolicy& policy = options_.retry;
    double exponential = static_cast<double>(policy.backoff_base.count()) *
                         std::pow(policy.backoff_factor, static_cast<double>(retry));
    double capped = std::min(exponential, static_cast<double>(policy.backoff_cap.count()));

    double jitter;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        std::uniform_real_distribution<double> dist(0.5, 1.0);
        jitter = dist(rng_);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(capped * jitter));
}

HttpRequest HttpGateway::build_request(const ApiRequest& request, const std::string& access_token) const {
    HttpRequest http;
    http.method = request.method;
    http.url = options_.api_base + request.path;
    if (!request.query.empty()) {
        http.url += "?" + build_query_string(request.query);
    }
    http.timeout = options_.request_timeout;
    http.headers = {
        {"Authorization", "Bearer " + access_token},
        {"Accept", "application/json"}
    };

    if (request.raw_body.has_value()) {
        http.body = *request.raw_body;
        http.headers["Content-Type"] = request.content_type;
    } else if (request.body.has_value()) {
        http.body = request.body->dump();
        http.headers["Content-Type"] = "application/json";
    }

    for (const auto& [key, value] : request.headers) {
        http.headers[key] = value;
    }
    return http;
}

void HttpGateway::wait(std::chrono::milliseconds duration, const CallContext& ctx) {
    if (auto remaining = ctx.remaining(clock_())) {
        if (*remaining < duration) {
            throw TimeoutError();
        }
    }
    sleep_(duration, ctx);
}

void HttpGateway::wait_for_rate_limit(const CallContext& ctx) {
    std::chrono::milliseconds pending{0};
    {
        std::lock_guard<std::mutex> lock(rate_limit_mutex_);
        if (rate_limit_.retry_after.has_value()) {
            auto until = rate_limit_.observed_at + *rate_limit_.retry_after;
            auto now = clock_();
            if (until > now) {
                pending = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
            }
        }
    }
    if (pending.count() > 0) {
        logger()->debug("Rate limited, waiting {}ms before sending", pending.count());
        wait(pending, ctx);
    }
}

void HttpGateway::record_rate_limit(std::chrono::milliseconds retry_after) {
    std::lock_guard<std::mutex> lock(rate_limit_mutex_);
    rate_limit_.retry_after = retry_after;
    rate_limit_.observed_at = clock_();
}

void HttpGateway::raise_client_error(const ApiRequest& request, const HttpResponse& response) const {
    std::string error_msg = response.body;

    json data = json::parse(response.body, nullptr, false);
    if (data.is_object()) {
        if (data.contains("message") && data["message"].is_string()) {
            error_msg = data["message"].get<std::string>();
        } else if (data.contains("error") && data["error"].is_object() &&
                   data["error"].contains("message") && data["error"]["message"].is_string()) {
            error_msg = data["error"]["message"].get<std::string>();
        }
    }

    std::string prefix = request.method + " " + request.path + ": ";
    switch (response.status) {
        case 403:
            throw PermissionDeniedError(prefix + "Permission denied: " + error_msg, response.body);
        case 404:
            throw NotFoundError(prefix + "Not found: " + error_msg, response.body);
        default:
            throw ValidationError(prefix + "API error " + std::to_string(response.status) + ": " + error_msg,
                                  static_cast<int>(response.status), response.body);
    }
}

json HttpGateway::execute(const ApiRequest& request, const CallContext& ctx) {
    std::string access_token = token_manager_->get_valid_token(ctx);

    const RetryPolicy& policy = options_.retry;
    bool refreshed_after_unauthorized = false;
    int rate_limit_retries = 0;
    int transient_retries = 0;
    int attempts = 0;

    while (true) {
        ctx.throw_if_cancelled();
        wait_for_rate_limit(ctx);

        HttpRequest http = build_request(request, access_token);
        ++attempts;

        auto start = clock_();
        HttpResponse response;
        try {
            response = transport_->send(http);
        } catch (const ConnectionError& e) {
            logger()->warn("{} {} attempt {} failed: {}", request.method, request.path, attempts, e.what());
            if (transient_retries >= policy.max_transient_retries) {
                throw TransientNetworkError(
                    request.method + " " + request.path + " failed after " +
                        std::to_string(attempts) + " attempts: " + e.what(),
                    attempts);
            }
            wait(backoff_delay(transient_retries++), ctx);
            continue;
        }
        double duration = std::chrono::duration<double>(clock_() - start).count();
        log_api_request(request.method, request.path, response.status, duration);

        if (response.status >= 200 && response.status < 300) {
            if (response.body.empty()) {
                return json::object();
            }
            json body = json::parse(response.body, nullptr, false);
            return body.is_discarded() ? json(response.body) : body;
        }

        if (response.status == 401) {
            if (refreshed_after_unauthorized) {
                throw AuthError(AuthErrorKind::Unauthorized,
                                request.method + " " + request.path + " unauthorized after token refresh");
            }
            refreshed_after_unauthorized = true;
            access_token = token_manager_->force_refresh(access_token, ctx);
            continue;
        }

        if (response.status == 429) {
            std::optional<std::chrono::milliseconds> retry_after;
            if (auto header = response.header("retry-after")) {
                retry_after = parse_retry_after(*header);
            }
            if (rate_limit_retries >= policy.max_rate_limit_retries) {
                throw RateLimitError("Rate limit exceeded: " + request.method + " " + request.path +
                                         " after " + std::to_string(attempts) + " attempts",
                                     retry_after);
            }
            record_rate_limit(retry_after.value_or(backoff_delay(rate_limit_retries)));
            ++rate_limit_retries;
            continue;
        }

        if (response.status >= 500) {
            if (transient_retries >= policy.max_transient_retries) {
                throw TransientNetworkError(
                    request.method + " " + request.path + " failed after " + std::to_string(attempts) +
                        " attempts with status " + std::to_string(response.status),
                    attempts,
                    static_cast<int>(response.status));
            }
            wait(backoff_delay(transient_retries++), ctx);
            continue;
        }

        raise_client_error(request, response);
    }
}

} // namespace canvasdk

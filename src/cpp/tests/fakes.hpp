/**
 * @file fakes.hpp
 * @brief Scripted transport and manual clock for CanvaSDK tests
 */

#ifndef CANVASDK_TESTS_FAKES_HPP
#define CANVASDK_TESTS_FAKES_HPP

#include <canvasdk/canvasdk.hpp>
#include <deque>
#include <stdexcept>

namespace canvasdk {
namespace fakes {

inline HttpResponse json_response(long status, const json& body,
                                  std::map<std::string, std::string> headers = {}) {
    HttpResponse response;
    response.status = status;
    response.body = body.is_null() ? "" : body.dump();
    response.headers = std::move(headers);
    return response;
}

inline HttpResponse token_response(const std::string& access_token,
                                   const std::string& refresh_token = "",
                                   int64_t expires_in = 3600) {
    json body = {
        {"access_token", access_token},
        {"token_type", "Bearer"},
        {"expires_in", expires_in},
        {"scope", "asset:read design:meta:read"}
    };
    if (!refresh_token.empty()) {
        body["refresh_token"] = refresh_token;
    }
    return json_response(200, body);
}

inline json job_body(const std::string& id, const std::string& status, json extra = json::object()) {
    json job = {{"id", id}, {"status", status}};
    for (const auto& [key, value] : extra.items()) {
        job[key] = value;
    }
    return {{"job", job}};
}

/**
 * HttpTransport that answers from routes matched by URL substring.
 *
 * A route is either a handler or a queue of responses; the last queued
 * response repeats once the queue is drained. Handlers run outside the
 * transport lock so they may block.
 */
class FakeTransport : public HttpTransport {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    void on(const std::string& url_fragment, Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_.push_back({url_fragment, std::move(handler), {}});
    }

    void respond(const std::string& url_fragment, std::vector<HttpResponse> responses) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_.push_back({url_fragment, nullptr,
                           std::deque<HttpResponse>(responses.begin(), responses.end())});
    }

    HttpResponse send(const HttpRequest& request) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            for (auto& route : routes_) {
                if (request.url.find(route.fragment) == std::string::npos) {
                    continue;
                }
                if (route.handler) {
                    handler = route.handler;
                    break;
                }
                HttpResponse response = route.responses.front();
                if (route.responses.size() > 1) {
                    route.responses.pop_front();
                }
                return response;
            }
        }
        if (!handler) {
            throw std::logic_error("No route for " + request.method + " " + request.url);
        }
        return handler(request);
    }

    size_t count(const std::string& url_fragment) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& request : requests_) {
            if (request.url.find(url_fragment) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

    size_t total() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    struct Route {
        std::string fragment;
        Handler handler;
        std::deque<HttpResponse> responses;
    };

    std::vector<Route> routes_;
    std::vector<HttpRequest> requests_;
    mutable std::mutex mutex_;
};

/**
 * Manual steady and wall clocks. sleeper() advances both instead of blocking
 * and records every requested duration.
 */
class FakeClock {
public:
    FakeClock()
        : steady_(std::chrono::steady_clock::time_point(std::chrono::hours(1))),
          system_(std::chrono::seconds(1700000000)) {}

    SteadyTimePoint steady_now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return steady_;
    }

    Timestamp system_now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return system_;
    }

    void advance(std::chrono::milliseconds duration) {
        std::lock_guard<std::mutex> lock(mutex_);
        steady_ += duration;
        system_ += duration;
    }

    SteadyClock steady() {
        return [this]() { return steady_now(); };
    }

    SystemClock system() {
        return [this]() { return system_now(); };
    }

    SleepFunction sleeper() {
        return [this](std::chrono::milliseconds duration, const CallContext& ctx) {
            ctx.throw_if_cancelled();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                sleeps_.push_back(duration);
            }
            advance(duration);
        };
    }

    std::vector<std::chrono::milliseconds> sleeps() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sleeps_;
    }

private:
    SteadyTimePoint steady_;
    Timestamp system_;
    std::vector<std::chrono::milliseconds> sleeps_;
    mutable std::mutex mutex_;
};

/**
 * Store, OAuth client, token manager and gateway wired to fakes
 */
struct GatewayFixture {
    FakeClock clock;
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<CredentialStore> store = std::make_shared<CredentialStore>();
    std::shared_ptr<OAuthClient> oauth_client;
    std::shared_ptr<TokenManager> token_manager;
    std::shared_ptr<HttpGateway> gateway;

    static constexpr const char* API_BASE = "https://api.test/rest/v1";

    GatewayFixture() {
        OAuthSettings settings;
        settings.client_id = "client-id";
        settings.client_secret = "client-secret";
        settings.redirect_uri = "http://localhost:8080/callback";
        settings.api_base = API_BASE;
        settings.auth_base = "https://auth.test/oauth";

        oauth_client = std::make_shared<OAuthClient>(settings, transport, clock.system());
        token_manager = std::make_shared<TokenManager>(
            store, oauth_client, std::chrono::seconds(60), clock.system(), clock.steady());

        GatewayOptions options;
        options.api_base = API_BASE;
        gateway = std::make_shared<HttpGateway>(transport, token_manager, options,
                                                clock.sleeper(), clock.steady());
    }

    void sign_in(const std::string& access_token = "access-1",
                 std::chrono::seconds lifetime = std::chrono::seconds(3600)) {
        Credential credential;
        credential.access_token = access_token;
        credential.refresh_token = "refresh-1";
        credential.expires_at = clock.system_now() + lifetime;
        store->set(credential);
    }
};

} // namespace fakes
} // namespace canvasdk

#endif // CANVASDK_TESTS_FAKES_HPP

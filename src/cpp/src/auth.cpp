/**
 * @file auth.cpp
 * @brief OAuth 2.0 + PKCE implementation for CanvaSDK C++
 */

#include "canvasdk/auth.hpp"
#include "canvasdk/errors.hpp"
#include "canvasdk/logging.hpp"
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <algorithm>

namespace canvasdk {

static Timestamp system_now() {
    return std::chrono::system_clock::now();
}

// =============================================================================
// PKCE helpers
// =============================================================================

std::vector<uint8_t> secure_random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        throw CanvaSDKError("Secure random generator failure", "CRYPTO_ERROR");
    }
    return bytes;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    static const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string result;

    size_t i = 0;
    while (i < data.size()) {
        uint32_t octet_a = i < data.size() ? data[i++] : 0;
        uint32_t octet_b = i < data.size() ? data[i++] : 0;
        uint32_t octet_c = i < data.size() ? data[i++] : 0;

        uint32_t triple = (octet_a << 16) + (octet_b << 8) + octet_c;

        result += alphabet[(triple >> 18) & 0x3F];
        result += alphabet[(triple >> 12) & 0x3F];
        result += alphabet[(triple >> 6) & 0x3F];
        result += alphabet[triple & 0x3F];
    }

    // Padding
    size_t mod = data.size() % 3;
    if (mod > 0) {
        for (size_t j = 0; j < 3 - mod; j++) {
            result[result.length() - 1 - j] = '=';
        }
    }

    return result;
}

std::string base64url_encode(const std::vector<uint8_t>& data) {
    std::string encoded = base64_encode(data);
    std::replace(encoded.begin(), encoded.end(), '+', '-');
    std::replace(encoded.begin(), encoded.end(), '/', '_');
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    return encoded;
}

std::string generate_code_verifier() {
    return base64url_encode(secure_random_bytes(PKCE_VERIFIER_BYTES));
}

std::string derive_code_challenge(const std::string& code_verifier) {
    std::vector<uint8_t> digest(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(code_verifier.data()), code_verifier.size(),
           digest.data());
    return base64url_encode(digest);
}

std::string generate_state() {
    return base64url_encode(secure_random_bytes(OAUTH_STATE_BYTES));
}

// =============================================================================
// OAuthClient
// =============================================================================

OAuthClient::OAuthClient(OAuthSettings settings, std::shared_ptr<HttpTransport> transport,
                         SystemClock clock)
    : settings_(std::move(settings)),
      transport_(std::move(transport)),
      clock_(clock ? std::move(clock) : SystemClock(&system_now)) {
}

std::string OAuthClient::token_endpoint() const {
    return settings_.api_base + CANVA_TOKEN_PATH;
}

Credential OAuthClient::exchange_code(const std::string& authorization_code,
                                      const std::string& code_verifier) {
    return request_token({
        {"grant_type", "authorization_code"},
        {"code", authorization_code},
        {"code_verifier", code_verifier},
        {"redirect_uri", settings_.redirect_uri}
    }, "");
}

Credential OAuthClient::refresh(const Credential& current) {
    if (current.refresh_token.empty()) {
        throw AuthError(AuthErrorKind::InvalidGrant, "No refresh token available");
    }
    return request_token({
        {"grant_type", "refresh_token"},
        {"refresh_token", current.refresh_token}
    }, current.refresh_token);
}

void OAuthClient::require_settings(bool need_secret) const {
    if (settings_.client_id.empty()) {
        throw ConfigurationError("CANVA_CLIENT_ID is not set", "CANVA_CLIENT_ID");
    }
    if (need_secret && settings_.client_secret.empty()) {
        throw ConfigurationError("CANVA_CLIENT_SECRET is not set", "CANVA_CLIENT_SECRET");
    }
    if (settings_.redirect_uri.empty()) {
        throw ConfigurationError("CANVA_REDIRECT_URI is not set", "CANVA_REDIRECT_URI");
    }
}

static std::string string_member(const json& object, const char* key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

Credential OAuthClient::request_token(const std::map<std::string, std::string>& form,
                                      const std::string& previous_refresh_token) {
    require_settings(true);
    std::string client_credentials = settings_.client_id + ":" + settings_.client_secret;

    HttpRequest request;
    request.method = "POST";
    request.url = token_endpoint();
    request.body = build_query_string(form);
    request.timeout = settings_.request_timeout;
    request.headers = {
        {"Authorization", "Basic " + base64_encode(std::vector<uint8_t>(
            client_credentials.begin(), client_credentials.end()))},
        {"Content-Type", "application/x-www-form-urlencoded"},
        {"Accept", "application/json"}
    };

    const std::string grant_type = form.at("grant_type");
    auto start = std::chrono::steady_clock::now();
    HttpResponse response;
    try {
        response = transport_->send(request);
    } catch (const ConnectionError& e) {
        throw TransientNetworkError("Token request failed: " + std::string(e.what()), 1);
    }
    double duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    log_api_request("POST", CANVA_TOKEN_PATH, response.status, duration);

    json token_data = json::parse(response.body, nullptr, false);

    if (response.status >= 500 || response.status == 429) {
        throw TransientNetworkError(
            "Token endpoint unavailable: " + std::to_string(response.status),
            1,
            static_cast<int>(response.status)
        );
    }

    if (response.status >= 400) {
        std::string error_code = string_member(token_data, "error");
        std::string error = error_code.empty() ? "HTTP " + std::to_string(response.status) : error_code;
        std::string description = string_member(token_data, "error_description");
        if (!description.empty()) {
            error += ": " + description;
        }
        std::string message = "Token request rejected (" + grant_type + "): " + error;
        if (response.status == 400 && error_code == "invalid_grant") {
            throw AuthError(AuthErrorKind::InvalidGrant, message);
        }
        log_oauth_flow("Token request rejected", grant_type + " status=" + std::to_string(response.status));
        throw ValidationError(message, static_cast<int>(response.status), response.body);
    }

    if (!token_data.is_object() || !token_data.contains("access_token") ||
        !token_data["access_token"].is_string()) {
        throw ValidationError("Malformed token response", static_cast<int>(response.status),
                              response.body);
    }

    Timestamp issued_at = clock_();
    Credential credential = Credential::from_token_response(token_data, issued_at, previous_refresh_token);
    auto expires_in = std::chrono::duration_cast<std::chrono::seconds>(credential.expires_at - issued_at);

    log_oauth_flow(grant_type == "refresh_token" ? "Token refresh successful" : "Token exchange successful",
                   "expires_in=" + std::to_string(expires_in.count()) +
                   " scope=" + join_scopes(credential.granted_scopes));
    return credential;
}

// =============================================================================
// AuthorizationFlow
// =============================================================================

AuthorizationFlow::AuthorizationFlow(std::shared_ptr<OAuthClient> oauth_client,
                                     std::shared_ptr<CredentialStore> store,
                                     SystemClock clock)
    : oauth_client_(std::move(oauth_client)),
      store_(std::move(store)),
      clock_(clock ? std::move(clock) : SystemClock(&system_now)) {
}

AuthorizationRequest AuthorizationFlow::create_authorization_url(const std::set<std::string>& scopes) {
    oauth_client_->require_settings(false);
    const OAuthSettings& settings = oauth_client_->settings();

    AuthorizationRequest request;
    request.scopes = scopes.empty()
        ? std::set<std::string>(CANVA_DEFAULT_SCOPES.begin(), CANVA_DEFAULT_SCOPES.end())
        : scopes;
    request.code_verifier = generate_code_verifier();
    request.code_challenge = derive_code_challenge(request.code_verifier);
    request.state = generate_state();
    request.created_at = clock_();

    request.url = settings.auth_base + CANVA_AUTHORIZE_PATH + "?" +
        "code_challenge=" + percent_encode(request.code_challenge) +
        "&code_challenge_method=" + CANVA_CODE_CHALLENGE_METHOD +
        "&scope=" + percent_encode(join_scopes(request.scopes)) +
        "&response_type=code" +
        "&client_id=" + percent_encode(settings.client_id) +
        "&state=" + percent_encode(request.state) +
        "&redirect_uri=" + percent_encode(settings.redirect_uri);

    log_oauth_flow("Authorization URL created",
                   "scopes=" + join_scopes(request.scopes) + " state=" + redact(request.state));
    return request;
}

bool AuthorizationFlow::consume_verifier(const std::string& code_verifier) {
    Timestamp now = clock_();
    Timestamp cutoff = now - std::chrono::seconds(CONSUMED_VERIFIER_RETENTION_SECONDS);

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = consumed_challenges_.begin(); it != consumed_challenges_.end();) {
        if (it->second < cutoff) {
            it = consumed_challenges_.erase(it);
        } else {
            ++it;
        }
    }
    return consumed_challenges_.emplace(derive_code_challenge(code_verifier), now).second;
}

size_t AuthorizationFlow::remembered_verifiers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consumed_challenges_.size();
}

Credential AuthorizationFlow::exchange(
    const std::string& authorization_code,
    const std::string& code_verifier,
    const std::string& expected_state,
    const std::string& received_state
) {
    bool first_use = consume_verifier(code_verifier);

    if (expected_state.empty() || received_state != expected_state) {
        log_oauth_flow("Token exchange rejected", "state mismatch");
        throw AuthError(AuthErrorKind::InvalidState, "OAuth state mismatch");
    }

    if (!first_use) {
        log_oauth_flow("Token exchange rejected", "code verifier already used");
        throw AuthError(AuthErrorKind::InvalidGrant, "Code verifier has already been used");
    }

    Credential credential = oauth_client_->exchange_code(authorization_code, code_verifier);
    store_->set(credential);
    return credential;
}

} // namespace canvasdk

/**
 * @file auth.hpp
 * @brief OAuth 2.0 + PKCE authentication for CanvaSDK C++
 */

#ifndef CANVASDK_AUTH_HPP
#define CANVASDK_AUTH_HPP

#include "types.hpp"
#include "credential_store.hpp"
#include "transport.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <set>

namespace canvasdk {

/**
 * OAuth client settings, passed through as opaque values
 */
struct OAuthSettings {
    std::string client_id;
    std::string client_secret;
    std::string redirect_uri;
    std::string api_base = CANVA_API_BASE;
    std::string auth_base = CANVA_AUTH_BASE;
    std::chrono::milliseconds request_timeout{30000};
};

// =============================================================================
// PKCE helpers
// =============================================================================

/**
 * Cryptographically secure random bytes (OpenSSL RAND_bytes)
 */
std::vector<uint8_t> secure_random_bytes(size_t count);

std::string base64_encode(const std::vector<uint8_t>& data);

/**
 * Base64url without padding (RFC 4648 section 5)
 */
std::string base64url_encode(const std::vector<uint8_t>& data);

/**
 * 128-character verifier drawn from the unreserved charset
 */
std::string generate_code_verifier();

/**
 * S256 challenge: BASE64URL(SHA256(verifier))
 * @param code_verifier Verifier
 * @return Challenge
 */
std::string derive_code_challenge(const std::string& code_verifier);

/**
 * Opaque state token carrying OAUTH_STATE_BYTES of entropy
 */
std::string generate_state();

// =============================================================================
// Token endpoint
// =============================================================================

/**
 * Token endpoint client (authorization_code and refresh_token grants).
 *
 * A 400 invalid_grant throws AuthError(invalid_grant); any other 4xx throws
 * ValidationError. Network failures, 5xx and 429 throw TransientNetworkError.
 * Missing client settings throw ConfigurationError before anything is sent.
 * No request is retried here.
 */
class OAuthClient {
public:
    /**
     * Create an OAuth client
     * @param settings Client credentials and endpoints
     * @param transport HTTP transport
     * @param clock Wall clock for expiry calculation (defaults to system_clock::now)
     */
    OAuthClient(OAuthSettings settings, std::shared_ptr<HttpTransport> transport,
                SystemClock clock = nullptr);

    /**
     * Exchange an authorization code
     * @param authorization_code Code from the redirect
     * @param code_verifier Verifier matching the challenge sent earlier
     * @return New credential
     */
    Credential exchange_code(const std::string& authorization_code, const std::string& code_verifier);

    /**
     * Use a refresh token
     * @param current Credential holding the refresh token
     * @return New credential
     */
    Credential refresh(const Credential& current);

    const OAuthSettings& settings() const { return settings_; }

    /**
     * Throw ConfigurationError naming the first empty setting
     * @param need_secret Also require the client secret
     */
    void require_settings(bool need_secret) const;

    std::string token_endpoint() const;

private:
    Credential request_token(const std::map<std::string, std::string>& form,
                             const std::string& previous_refresh_token);

    OAuthSettings settings_;
    std::shared_ptr<HttpTransport> transport_;
    SystemClock clock_;
};

// =============================================================================
// Authorization flow
// =============================================================================

/**
 * Builds PKCE authorization URLs and exchanges the resulting codes
 */
class AuthorizationFlow {
public:
    AuthorizationFlow(std::shared_ptr<OAuthClient> oauth_client,
                      std::shared_ptr<CredentialStore> store,
                      SystemClock clock = nullptr);

    /**
     * Create an authorization request. Verifier and state are returned to
     * the caller and not kept.
     * @param scopes Requested scopes (empty for CANVA_DEFAULT_SCOPES)
     * @return Authorization request including the URL to open
     */
    AuthorizationRequest create_authorization_url(const std::set<std::string>& scopes = {});

    /**
     * Exchange an authorization code and store the credential.
     * Each verifier may be presented once; a mismatched state also uses it up.
     * @param authorization_code Code from the redirect
     * @param code_verifier Verifier from create_authorization_url
     * @param expected_state State from create_authorization_url
     * @param received_state State from the redirect
     * @return Stored credential
     */
    Credential exchange(
        const std::string& authorization_code,
        const std::string& code_verifier,
        const std::string& expected_state,
        const std::string& received_state
    );

    /**
     * Number of verifier digests currently remembered
     */
    size_t remembered_verifiers() const;

private:
    bool consume_verifier(const std::string& code_verifier);

    std::shared_ptr<OAuthClient> oauth_client_;
    std::shared_ptr<CredentialStore> store_;
    SystemClock clock_;
    // S256 digest of each presented verifier -> when it was presented
    std::map<std::string, Timestamp> consumed_challenges_;
    mutable std::mutex mutex_;
};

} // namespace canvasdk

#endif // CANVASDK_AUTH_HPP

/**
 * @file authorization_flow_test.cpp
 * @brief Code exchange tests
 */

#include "fakes.hpp"
#include <gtest/gtest.h>

using namespace canvasdk;
using namespace canvasdk::fakes;

class AuthorizationFlowTest : public ::testing::Test {
protected:
    GatewayFixture fx;
    AuthorizationFlow flow{fx.oauth_client, fx.store, fx.clock.system()};
};

TEST_F(AuthorizationFlowTest, StateMismatchFailsWithoutNetworkCall) {
    AuthorizationRequest request = flow.create_authorization_url();

    try {
        flow.exchange("code-1", request.code_verifier, request.state, "forged-state");
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_EQ(e.kind(), AuthErrorKind::InvalidState);
    }
    EXPECT_EQ(fx.transport->total(), 0u);
    EXPECT_FALSE(fx.store->is_authenticated());
}

TEST_F(AuthorizationFlowTest, EmptyExpectedStateIsRejected) {
    AuthorizationRequest request = flow.create_authorization_url();

    try {
        flow.exchange("code-1", request.code_verifier, "", "");
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_EQ(e.kind(), AuthErrorKind::InvalidState);
    }
    EXPECT_EQ(fx.transport->total(), 0u);
}

TEST_F(AuthorizationFlowTest, SuccessfulExchangeStoresCredential) {
    fx.transport->respond("/oauth/token", {token_response("access-1", "refresh-1", 1800)});
    AuthorizationRequest request = flow.create_authorization_url();

    Credential credential = flow.exchange("code-1", request.code_verifier, request.state, request.state);

    EXPECT_EQ(credential.access_token, "access-1");
    EXPECT_EQ(credential.refresh_token, "refresh-1");
    EXPECT_EQ(credential.expires_at, fx.clock.system_now() + std::chrono::seconds(1800));
    EXPECT_EQ(credential.granted_scopes, (std::set<std::string>{"asset:read", "design:meta:read"}));

    auto stored = fx.store->get();
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->access_token, "access-1");

    auto requests = fx.transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    const HttpRequest& sent = requests.front();
    EXPECT_EQ(sent.method, "POST");
    EXPECT_EQ(sent.url, std::string(GatewayFixture::API_BASE) + "/oauth/token");
    EXPECT_EQ(sent.headers.at("Content-Type"), "application/x-www-form-urlencoded");
    std::string client_credentials = "client-id:client-secret";
    EXPECT_EQ(sent.headers.at("Authorization"),
              "Basic " + base64_encode(std::vector<uint8_t>(client_credentials.begin(), client_credentials.end())));
    EXPECT_NE(sent.body.find("grant_type=authorization_code"), std::string::npos);
    EXPECT_NE(sent.body.find("code=code-1"), std::string::npos);
    EXPECT_NE(sent.body.find("code_verifier=" + request.code_verifier), std::string::npos);
    EXPECT_NE(sent.body.find("redirect_uri=http%3A%2F%2Flocalhost%3A8080%2Fcallback"), std::string::npos);
}

TEST_F(AuthorizationFlowTest, VerifierCannotBeReused) {
    fx.transport->respond("/oauth/token", {token_response("access-1", "refresh-1")});
    AuthorizationRequest request = flow.create_authorization_url();
    flow.exchange("code-1", request.code_verifier, request.state, request.state);

    try {
        flow.exchange("code-1", request.code_verifier, request.state, request.state);
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_EQ(e.kind(), AuthErrorKind::InvalidGrant);
    }
    EXPECT_EQ(fx.transport->count("/oauth/token"), 1u);
}

TEST_F(AuthorizationFlowTest, StateMismatchUsesUpVerifier) {
    fx.transport->respond("/oauth/token", {token_response("access-1", "refresh-1")});
    AuthorizationRequest request = flow.create_authorization_url();

    EXPECT_THROW(flow.exchange("code-1", request.code_verifier, request.state, "wrong"), AuthError);
    try {
        flow.exchange("code-1", request.code_verifier, request.state, request.state);
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_EQ(e.kind(), AuthErrorKind::InvalidGrant);
    }
    EXPECT_EQ(fx.transport->total(), 0u);
}

TEST_F(AuthorizationFlowTest, ProviderRejectionIsInvalidGrant) {
    fx.transport->respond("/oauth/token", {json_response(400, {
        {"error", "invalid_grant"},
        {"error_description", "Authorization code expired"}
    })});
    AuthorizationRequest request = flow.create_authorization_url();

    try {
        flow.exchange("code-1", request.code_verifier, request.state, request.state);
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_EQ(e.kind(), AuthErrorKind::InvalidGrant);
        EXPECT_NE(std::string(e.what()).find("Authorization code expired"), std::string::npos);
    }
    EXPECT_FALSE(fx.store->is_authenticated());
}

TEST_F(AuthorizationFlowTest, ServerErrorIsTransient) {
    fx.transport->respond("/oauth/token", {json_response(503, {{"message", "down"}})});
    AuthorizationRequest request = flow.create_authorization_url();

    try {
        flow.exchange("code-1", request.code_verifier, request.state, request.state);
        FAIL() << "expected TransientNetworkError";
    } catch (const TransientNetworkError& e) {
        EXPECT_EQ(e.last_status().value_or(0), 503);
    }
    EXPECT_FALSE(fx.store->is_authenticated());
}

TEST_F(AuthorizationFlowTest, MalformedTokenResponseIsRejected) {
    fx.transport->respond("/oauth/token", {json_response(200, {{"token_type", "Bearer"}})});
    AuthorizationRequest request = flow.create_authorization_url();

    EXPECT_THROW(flow.exchange("code-1", request.code_verifier, request.state, request.state),
                 ValidationError);
    EXPECT_FALSE(fx.store->is_authenticated());
}

TEST_F(AuthorizationFlowTest, RejectedClientCredentialsAreNotInvalidGrant) {
    fx.transport->respond("/oauth/token", {json_response(401, {
        {"error", "invalid_client"},
        {"error_description", "Client authentication failed"}
    })});
    AuthorizationRequest request = flow.create_authorization_url();

    try {
        flow.exchange("code-1", request.code_verifier, request.state, request.state);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.status(), 401);
        EXPECT_NE(std::string(e.what()).find("invalid_client"), std::string::npos);
    }
    EXPECT_FALSE(fx.store->is_authenticated());
}

TEST_F(AuthorizationFlowTest, MissingClientSecretFailsBeforeTokenRequest) {
    OAuthSettings settings = fx.oauth_client->settings();
    settings.client_secret.clear();
    auto client = std::make_shared<OAuthClient>(settings, fx.transport, fx.clock.system());
    AuthorizationFlow unconfigured(client, fx.store, fx.clock.system());

    AuthorizationRequest request = unconfigured.create_authorization_url();
    try {
        unconfigured.exchange("code-1", request.code_verifier, request.state, request.state);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.config_key(), "CANVA_CLIENT_SECRET");
    }
    EXPECT_EQ(fx.transport->total(), 0u);
}

TEST_F(AuthorizationFlowTest, MissingClientIdOrRedirectBlocksAuthorizationUrl) {
    OAuthSettings no_id = fx.oauth_client->settings();
    no_id.client_id.clear();
    AuthorizationFlow without_id(std::make_shared<OAuthClient>(no_id, fx.transport), fx.store);
    try {
        without_id.create_authorization_url();
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.config_key(), "CANVA_CLIENT_ID");
        EXPECT_EQ(e.code(), "CONFIGURATION_ERROR");
    }

    OAuthSettings no_redirect = fx.oauth_client->settings();
    no_redirect.redirect_uri.clear();
    AuthorizationFlow without_redirect(std::make_shared<OAuthClient>(no_redirect, fx.transport), fx.store);
    try {
        without_redirect.create_authorization_url();
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.config_key(), "CANVA_REDIRECT_URI");
    }
}

TEST_F(AuthorizationFlowTest, OldVerifierDigestsArePruned) {
    AuthorizationRequest first = flow.create_authorization_url();
    EXPECT_THROW(flow.exchange("code-1", first.code_verifier, first.state, "wrong"), AuthError);
    EXPECT_EQ(flow.remembered_verifiers(), 1u);

    fx.clock.advance(std::chrono::seconds(CONSUMED_VERIFIER_RETENTION_SECONDS + 1));
    AuthorizationRequest second = flow.create_authorization_url();
    EXPECT_THROW(flow.exchange("code-2", second.code_verifier, second.state, "wrong"), AuthError);

    EXPECT_EQ(flow.remembered_verifiers(), 1u);
}

TEST_F(AuthorizationFlowTest, RecentVerifierDigestsAreKept) {
    AuthorizationRequest first = flow.create_authorization_url();
    EXPECT_THROW(flow.exchange("code-1", first.code_verifier, first.state, "wrong"), AuthError);

    fx.clock.advance(std::chrono::seconds(CONSUMED_VERIFIER_RETENTION_SECONDS - 1));
    try {
        flow.exchange("code-1", first.code_verifier, first.state, first.state);
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_EQ(e.kind(), AuthErrorKind::InvalidGrant);
    }
    EXPECT_EQ(fx.transport->total(), 0u);
}

/**
 * @file gateway_test.cpp
 * @brief Gateway retry, refresh and error mapping tests
 */

#include "fakes.hpp"
#include <gtest/gtest.h>

using namespace canvasdk;
using namespace canvasdk::fakes;

using std::chrono::milliseconds;

class GatewayTest : public ::testing::Test {
protected:
    void SetUp() override { fx.sign_in("access-1"); }

    GatewayFixture fx;
};

TEST(RetryAfterTest, ParsesDelaySeconds) {
    EXPECT_EQ(parse_retry_after("5").value_or(milliseconds(0)), milliseconds(5000));
    EXPECT_EQ(parse_retry_after(" 12 ").value_or(milliseconds(0)), milliseconds(12000));
    EXPECT_FALSE(parse_retry_after("Wed, 21 Oct 2015 07:28:00 GMT").has_value());
    EXPECT_FALSE(parse_retry_after("").has_value());
    EXPECT_FALSE(parse_retry_after("-3").has_value());
}

TEST_F(GatewayTest, SuccessReturnsParsedBodyWithBearerToken) {
    fx.transport->respond("/users/me", {json_response(200, {{"team_user", {{"user_id", "U1"}}}})});

    json body = fx.gateway->execute(ApiRequest::get("/users/me"));

    EXPECT_EQ(body["team_user"]["user_id"], "U1");
    auto requests = fx.transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, std::string(GatewayFixture::API_BASE) + "/users/me");
    EXPECT_EQ(requests[0].headers.at("Authorization"), "Bearer access-1");
}

TEST_F(GatewayTest, EmptyBodyBecomesEmptyObject) {
    fx.transport->respond("/assets/A1", {json_response(204, nullptr)});

    ApiRequest request = ApiRequest::get("/assets/A1");
    request.method = "DELETE";
    EXPECT_EQ(fx.gateway->execute(request), json::object());
}

TEST_F(GatewayTest, QueryAndBodyAreEncoded) {
    fx.transport->respond("/designs", {json_response(200, json::object())});

    ApiRequest request = ApiRequest::post("/designs", {{"title", "Poster"}});
    request.query = {{"query", "summer sale"}};
    fx.gateway->execute(request);

    HttpRequest sent = fx.transport->requests().front();
    EXPECT_EQ(sent.url, std::string(GatewayFixture::API_BASE) + "/designs?query=summer%20sale");
    EXPECT_EQ(sent.method, "POST");
    EXPECT_EQ(json::parse(sent.body), json({{"title", "Poster"}}));
    EXPECT_EQ(sent.headers.at("Content-Type"), "application/json");
}

TEST_F(GatewayTest, UnauthorizedRefreshesOnceAndRetries) {
    fx.transport->respond("/users/me", {
        json_response(401, {{"message", "expired"}}),
        json_response(200, {{"ok", true}})
    });
    fx.transport->respond("/oauth/token", {token_response("access-2")});

    json body = fx.gateway->execute(ApiRequest::get("/users/me"));

    EXPECT_EQ(body["ok"], true);
    EXPECT_EQ(fx.transport->count("/oauth/token"), 1u);
    EXPECT_EQ(fx.transport->count("/users/me"), 2u);
    EXPECT_EQ(fx.transport->requests().back().headers.at("Authorization"), "Bearer access-2");
}

TEST_F(GatewayTest, SecondUnauthorizedSurfaces) {
    fx.transport->respond("/users/me", {json_response(401, {{"message", "nope"}})});
    fx.transport->respond("/oauth/token", {token_response("access-2")});

    try {
        fx.gateway->execute(ApiRequest::get("/users/me"));
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_EQ(e.kind(), AuthErrorKind::Unauthorized);
    }
    EXPECT_EQ(fx.transport->count("/oauth/token"), 1u);
    EXPECT_EQ(fx.transport->count("/users/me"), 2u);
}

TEST_F(GatewayTest, RateLimitHonorsRetryAfter) {
    fx.transport->respond("/users/me", {
        json_response(429, json::object(), {{"Retry-After", "5"}}),
        json_response(200, {{"ok", true}})
    });

    fx.gateway->execute(ApiRequest::get("/users/me"));

    auto sleeps = fx.clock.sleeps();
    ASSERT_EQ(sleeps.size(), 1u);
    EXPECT_GE(sleeps[0], milliseconds(5000));
    EXPECT_EQ(fx.transport->count("/users/me"), 2u);
}

TEST_F(GatewayTest, RateLimitStateIsShared) {
    fx.transport->respond("/users/me", {
        json_response(429, json::object(), {{"retry-after", "7"}}),
        json_response(200, json::object())
    });

    fx.gateway->execute(ApiRequest::get("/users/me"));

    RateLimitState state = fx.gateway->rate_limit_state();
    ASSERT_TRUE(state.retry_after.has_value());
    EXPECT_EQ(*state.retry_after, milliseconds(7000));
}

TEST_F(GatewayTest, RateLimitRetriesAreBounded) {
    fx.transport->respond("/users/me", {json_response(429, json::object(), {{"Retry-After", "2"}})});

    try {
        fx.gateway->execute(ApiRequest::get("/users/me"));
        FAIL() << "expected RateLimitError";
    } catch (const RateLimitError& e) {
        EXPECT_EQ(e.retry_after().value_or(milliseconds(0)), milliseconds(2000));
    }
    EXPECT_EQ(fx.transport->count("/users/me"), 4u);
}

TEST_F(GatewayTest, ServerErrorsBackOffThenGiveUp) {
    fx.transport->respond("/users/me", {json_response(503, json::object())});

    try {
        fx.gateway->execute(ApiRequest::get("/users/me"));
        FAIL() << "expected TransientNetworkError";
    } catch (const TransientNetworkError& e) {
        EXPECT_EQ(e.attempts(), 4);
        EXPECT_EQ(e.last_status().value_or(0), 503);
    }

    auto sleeps = fx.clock.sleeps();
    ASSERT_EQ(sleeps.size(), 3u);
    for (size_t i = 0; i < sleeps.size(); ++i) {
        milliseconds full(1000 << i);
        EXPECT_GE(sleeps[i], full / 2);
        EXPECT_LE(sleeps[i], full);
    }
}

TEST_F(GatewayTest, ServerErrorThenSuccess) {
    fx.transport->respond("/users/me", {
        json_response(500, json::object()),
        json_response(200, {{"ok", true}})
    });

    EXPECT_EQ(fx.gateway->execute(ApiRequest::get("/users/me"))["ok"], true);
    EXPECT_EQ(fx.transport->count("/users/me"), 2u);
}

TEST_F(GatewayTest, ConnectionFailureIsRetried) {
    int calls = 0;
    fx.transport->on("/users/me", [&calls](const HttpRequest& request) {
        if (calls++ == 0) {
            throw ConnectionError("Connection refused", request.url);
        }
        return json_response(200, {{"ok", true}});
    });

    EXPECT_EQ(fx.gateway->execute(ApiRequest::get("/users/me"))["ok"], true);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(fx.clock.sleeps().size(), 1u);
}

TEST_F(GatewayTest, NotFoundIsNotRetried) {
    fx.transport->respond("/designs/D404", {json_response(404, {{"code", "design_not_found"},
                                                                {"message", "Design not found"}})});

    try {
        fx.gateway->execute(ApiRequest::get("/designs/D404"));
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.status(), 404);
        EXPECT_NE(std::string(e.what()).find("Design not found"), std::string::npos);
    }
    EXPECT_EQ(fx.transport->count("/designs/D404"), 1u);
    EXPECT_TRUE(fx.clock.sleeps().empty());
}

TEST_F(GatewayTest, ForbiddenMapsToPermissionDenied) {
    fx.transport->respond("/folders/F1", {json_response(403, {{"message", "Missing scope folder:read"}})});

    EXPECT_THROW(fx.gateway->execute(ApiRequest::get("/folders/F1")), PermissionDeniedError);
    EXPECT_EQ(fx.transport->count("/folders/F1"), 1u);
}

TEST_F(GatewayTest, BadRequestIsValidationError) {
    fx.transport->respond("/designs", {json_response(400, {{"error", {{"message", "title too long"}}}})});

    try {
        fx.gateway->execute(ApiRequest::post("/designs", {{"title", std::string(300, 'x')}}));
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.status(), 400);
        EXPECT_NE(std::string(e.what()).find("title too long"), std::string::npos);
    }
    EXPECT_EQ(fx.transport->count("/designs"), 1u);
}

TEST_F(GatewayTest, DeadlineShorterThanBackoffTimesOut) {
    fx.transport->respond("/users/me", {json_response(503, json::object())});

    CallContext ctx;
    ctx.deadline = fx.clock.steady_now() + milliseconds(100);

    EXPECT_THROW(fx.gateway->execute(ApiRequest::get("/users/me"), ctx), TimeoutError);
    EXPECT_EQ(fx.transport->count("/users/me"), 1u);
    EXPECT_TRUE(fx.clock.sleeps().empty());
}

TEST_F(GatewayTest, CancelledContextSendsNothing) {
    fx.transport->respond("/users/me", {json_response(200, json::object())});

    CancellationToken cancel;
    cancel.cancel();
    CallContext ctx;
    ctx.cancel = &cancel;

    EXPECT_THROW(fx.gateway->execute(ApiRequest::get("/users/me"), ctx), CancellationError);
    EXPECT_EQ(fx.transport->total(), 0u);
}

TEST_F(GatewayTest, BackoffDelayIsJitteredAndCapped) {
    for (int retry = 0; retry < 4; ++retry) {
        milliseconds full(1000 << retry);
        milliseconds delay = fx.gateway->backoff_delay(retry);
        EXPECT_GE(delay, full / 2);
        EXPECT_LE(delay, full);
    }
    milliseconds capped = fx.gateway->backoff_delay(20);
    EXPECT_GE(capped, milliseconds(15000));
    EXPECT_LE(capped, milliseconds(30000));
}

#include <gtest/gtest.h>
#include <RequestContext.h>
#include <SessionToken.h>
#include <drogon/Session.h>

#include <memory>

TEST(RequestContextTest, NoMarkerMeansAnonymous) {
    RequestContext ctx{drogon::HttpRequest::newHttpRequest()};
    EXPECT_FALSE(ctx.isAuthenticated());
    EXPECT_FALSE(ctx.identityMarker().has_value());
}

TEST(RequestContextTest, MarkerMeansAuthenticated) {
    RequestContext ctx{drogon::HttpRequest::newHttpRequest(), std::string{"user123"}};
    EXPECT_TRUE(ctx.isAuthenticated());
    EXPECT_EQ(ctx.identityMarker().value(), "user123");
}

TEST(RequestContextTest, EmptyAndBlankMarkersAreDropped) {
    EXPECT_FALSE(RequestContext(nullptr, std::string{}).isAuthenticated());
    EXPECT_FALSE(RequestContext(nullptr, std::string{"   "}).isAuthenticated());
    EXPECT_FALSE(RequestContext(nullptr, std::string{"\t\r\n"}).isAuthenticated());
    EXPECT_TRUE(RequestContext(nullptr, std::string{" a "}).isAuthenticated());
}

TEST(RequestContextTest, RequestWithoutSessionIsAnonymous) {
    auto req = drogon::HttpRequest::newHttpRequest();
    auto ctx = RequestContext::fromRequest(req, "token");
    EXPECT_FALSE(ctx.isAuthenticated());
    EXPECT_EQ(ctx.request(), req);
}

TEST(RequestContextTest, NullRequestIsAnonymous) {
    auto ctx = RequestContext::fromRequest(nullptr, "token");
    EXPECT_FALSE(ctx.isAuthenticated());
    EXPECT_FALSE(ctx.request());
}

// --- Identity marker read from a drogon session ---
class RequestContextSessionTest : public ::testing::Test {
protected:
    drogon::HttpRequestPtr _req = drogon::HttpRequest::newHttpRequest();
    drogon::SessionPtr _session = std::make_shared<drogon::Session>("request_context_test_session");
};

TEST_F(RequestContextSessionTest, TokenNameIsTheMarker) {
    _session->insert("token", SessionToken::forUser("user123"));
    auto ctx = RequestContext::fromSession(_req, _session, "token");
    EXPECT_TRUE(ctx.isAuthenticated());
    EXPECT_EQ(ctx.identityMarker().value(), "user123");
    EXPECT_EQ(ctx.request(), _req);
}

TEST_F(RequestContextSessionTest, EmptySessionIsAnonymous) {
    EXPECT_FALSE(RequestContext::fromSession(_req, _session, "token").isAuthenticated());
    EXPECT_FALSE(RequestContext::fromSession(_req, nullptr, "token").isAuthenticated());
}

TEST_F(RequestContextSessionTest, TokenUnderOtherKeyIsIgnored) {
    _session->insert("user", SessionToken::forUser("user123"));
    EXPECT_FALSE(RequestContext::fromSession(_req, _session, "token").isAuthenticated());
    EXPECT_TRUE(RequestContext::fromSession(_req, _session, "user").isAuthenticated());
}

TEST_F(RequestContextSessionTest, TokenWithoutNameIsAnonymous) {
    _session->insert("token", SessionToken{});
    EXPECT_FALSE(RequestContext::fromSession(_req, _session, "token").isAuthenticated());
}

TEST_F(RequestContextSessionTest, TokenWithBlankNameIsAnonymous) {
    _session->insert("token", SessionToken::forUser(""));
    EXPECT_FALSE(RequestContext::fromSession(_req, _session, "token").isAuthenticated());
    _session->erase("token");
    _session->insert("token", SessionToken::forUser("  "));
    EXPECT_FALSE(RequestContext::fromSession(_req, _session, "token").isAuthenticated());
}

TEST_F(RequestContextSessionTest, TokenJsonCarriesLoginState) {
    auto json = SessionToken::forUser("alice").getJson();
    EXPECT_TRUE((*json)["authenticated"].asBool());
    EXPECT_EQ((*json)["name"].asString(), "alice");
    EXPECT_GT((*json)["tm"].asInt64(), 0);

    auto anonymous = SessionToken{}.getJson();
    EXPECT_FALSE((*anonymous)["authenticated"].asBool());
    EXPECT_FALSE(anonymous->isMember("name"));
}

#include <gtest/gtest.h>
#include <FallbackHandlers.h>
#include <ResponseGateMiddleware.h>

#include <memory>
#include <stdexcept>
#include <string>

// --- Test Fixture for the unmatched route and exception handlers ---
class FallbackHandlersTest : public ::testing::Test {
protected:
    std::shared_ptr<const ResponseGate> _gate = std::make_shared<const ResponseGate>();
    int _pages_rendered = 0;
    drogon::HttpResponsePtr _sent;

    // Verbose page echoing the request header, as the staging page does
    drogon::HttpResponsePtr render(int status, const drogon::HttpRequestPtr &req, const std::string &detail) {
        ++_pages_rendered;
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(static_cast<drogon::HttpStatusCode>(status));
        resp->setBody(detail + " cookie=" + (req ? req->getHeader("cookie") : std::string{}));
        return resp;
    }

    UnmatchedRouteHandler unmatched_route_handler() {
        return UnmatchedRouteHandler{_gate, [this](const RequestContext &ctx) {
                                         return render(404, ctx.request(), "No route matches");
                                     }};
    }

    GatedExceptionHandler exception_handler() {
        return GatedExceptionHandler{_gate, [this](const drogon::HttpRequestPtr &req, const std::string &detail) {
                                         return render(500, req, detail);
                                     }};
    }

    static drogon::HttpRequestPtr request_with_cookie(const std::string &cookie) {
        auto req = drogon::HttpRequest::newHttpRequest();
        req->addHeader("cookie", cookie);
        return req;
    }

    ResponseCallback recording() {
        return [this](const drogon::HttpResponsePtr &resp) { _sent = resp; };
    }
};

TEST_F(FallbackHandlersTest, UnmatchedRouteIsDecidedPerRequest) {
    auto handler = unmatched_route_handler();

    // A logged in caller first, then an anonymous one, then logged in again
    handler.handle(RequestContext{request_with_cookie("session=alice"), std::string{"alice"}}, recording());
    ASSERT_TRUE(_sent);
    EXPECT_EQ(_sent->getStatusCode(), drogon::k404NotFound);
    EXPECT_NE(std::string{_sent->body()}.find("session=alice"), std::string::npos);

    handler.handle(RequestContext{request_with_cookie("session=anonymous")}, recording());
    ASSERT_TRUE(_sent);
    EXPECT_EQ(_sent->getStatusCode(), drogon::k401Unauthorized);
    EXPECT_EQ(std::string{_sent->body()}.find("session="), std::string::npos);
    EXPECT_NE(std::string{_sent->body()}.find("404"), std::string::npos);

    handler.handle(RequestContext{request_with_cookie("session=bob"), std::string{"bob"}}, recording());
    EXPECT_EQ(_sent->getStatusCode(), drogon::k404NotFound);
    EXPECT_NE(std::string{_sent->body()}.find("session=bob"), std::string::npos);

    EXPECT_EQ(_pages_rendered, 3);
}

TEST_F(FallbackHandlersTest, UnmatchedRouteWithoutSessionIsHidden) {
    auto handler = unmatched_route_handler();
    handler(request_with_cookie("session=nobody"), recording());

    ASSERT_TRUE(_sent);
    EXPECT_EQ(_sent->getStatusCode(), drogon::k401Unauthorized);
    EXPECT_EQ(_pages_rendered, 1);
}

TEST_F(FallbackHandlersTest, ExceptionPageIsHiddenFromAnonymousCaller) {
    auto handler = exception_handler();
    auto req = request_with_cookie("session=anonymous");
    handler.handle(std::runtime_error{"SELECT * FROM users failed"}, RequestContext{req}, recording());

    ASSERT_TRUE(_sent);
    EXPECT_EQ(_sent->getStatusCode(), drogon::k401Unauthorized);
    EXPECT_NE(std::string{_sent->body()}.find("500"), std::string::npos);
    EXPECT_EQ(std::string{_sent->body()}.find("SELECT"), std::string::npos);
    EXPECT_TRUE(ResponseGateMiddleware::isGated(req));
}

TEST_F(FallbackHandlersTest, ExceptionPageIsShownToLoggedInCaller) {
    auto handler = exception_handler();
    auto req = request_with_cookie("session=alice");
    handler.handle(std::runtime_error{"SELECT * FROM users failed"}, RequestContext{req, std::string{"alice"}},
                   recording());

    ASSERT_TRUE(_sent);
    EXPECT_EQ(_sent->getStatusCode(), drogon::k500InternalServerError);
    EXPECT_NE(std::string{_sent->body()}.find("SELECT * FROM users failed"), std::string::npos);
    EXPECT_TRUE(ResponseGateMiddleware::isGated(req));
}

TEST_F(FallbackHandlersTest, ExceptionResultIsNotGatedTwiceByMiddleware) {
    auto handler = exception_handler();
    auto req = request_with_cookie("session=anonymous");
    ResponseGateMiddleware middleware{_gate};

    // The middleware wraps a handler that throws, the exception handler answers
    middleware.invoke(
        req,
        [&](std::function<void(const drogon::HttpResponsePtr &)> &&next) {
            handler(std::logic_error{"boom"}, req, std::move(next));
        },
        recording());

    ASSERT_TRUE(_sent);
    EXPECT_EQ(_sent->getStatusCode(), drogon::k401Unauthorized);
    EXPECT_NE(std::string{_sent->body()}.find("500"), std::string::npos);
}

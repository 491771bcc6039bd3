#include "gtest/gtest.h"
#include "common/errors.hpp"
#include "test_helpers.hpp"
#include "web/responses.hpp"
#include "web/router.hpp"

using namespace userapi;
using namespace userapi::web;
using userapi::test::makeRequest;

class RouterTest : public ::testing::Test {
protected:
    Router router;
    std::string lastRoute;
    std::unordered_map<std::string, std::string> lastValues;
    query_t lastQuery;

    void SetUp() override {
        router.add(http::verb::get, "/users", recorder("list"));
        router.add(http::verb::post, "/users", recorder("create"));
        router.add(http::verb::get, "/users/{id:int}", recorder("get"));
        router.add(http::verb::delete_, "/users/{id:int}", recorder("delete"));
        router.add(http::verb::get, "/tags/{name}", recorder("tag"));
        router.any("/error", recorder("error"));
    }

    Router::RouteHandler recorder(std::string name) {
        return [this, name](const RequestContext& ctx) {
            lastRoute = name;
            lastValues = ctx.routeValues;
            lastQuery = ctx.query;
            return makeText(http::status::ok, name);
        };
    }
};

TEST_F(RouterTest, MatchesMethodAndPath) {
    EXPECT_EQ(router.handle(makeRequest(http::verb::get, "/users")).body(), "list");
    EXPECT_EQ(router.handle(makeRequest(http::verb::post, "/users")).body(), "create");
    EXPECT_EQ(router.handle(makeRequest(http::verb::delete_, "/users/4")).body(), "delete");
}

TEST_F(RouterTest, CapturesRouteValuesAndQuery) {
    auto res = router.handle(makeRequest(http::verb::get, "/users/17?verbose=1"));
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(lastRoute, "get");
    EXPECT_EQ(lastValues["id"], "17");
    EXPECT_EQ(lastQuery["verbose"], "1");

    router.handle(makeRequest(http::verb::get, "/tags/hello%20world"));
    EXPECT_EQ(lastRoute, "tag");
    EXPECT_EQ(lastValues["name"], "hello world");
}

TEST_F(RouterTest, IgnoresCaseAndTrailingSlash) {
    EXPECT_EQ(router.handle(makeRequest(http::verb::get, "/Users/")).body(), "list");
    EXPECT_EQ(router.handle(makeRequest(http::verb::get, "//users//3")).body(), "get");
}

TEST_F(RouterTest, IntConstraint) {
    EXPECT_EQ(router.handle(makeRequest(http::verb::get, "/users/abc")).result(), http::status::not_found);
    EXPECT_EQ(router.handle(makeRequest(http::verb::get, "/users/99999999999")).result(),
              http::status::not_found);
    EXPECT_EQ(router.handle(makeRequest(http::verb::get, "/users/-3")).body(), "get");
}

TEST_F(RouterTest, UnknownPath) {
    auto res = router.handle(makeRequest(http::verb::get, "/nothing/here"));
    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_TRUE(res.body().empty());
}

TEST_F(RouterTest, MethodNotAllowed) {
    auto res = router.handle(makeRequest(http::verb::put, "/users"));
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(test::header(res, http::field::allow), "GET, POST");
}

TEST_F(RouterTest, AnyMethod) {
    EXPECT_EQ(router.handle(makeRequest(http::verb::get, "/error")).body(), "error");
    EXPECT_EQ(router.handle(makeRequest(http::verb::patch, "/error")).body(), "error");
}

TEST_F(RouterTest, IntRouteValue) {
    Request req = makeRequest(http::verb::get, "/users/5");
    RequestContext ctx{req, "/users/5", {{"id", "5"}}, {}};
    EXPECT_EQ(ctx.intRouteValue("id"), 5);
    EXPECT_THROW(ctx.intRouteValue("other"), InternalError);
    EXPECT_FALSE(ctx.queryValue("page").has_value());
}

TEST(RouterPatternTest, RejectsUnknownConstraint) {
    Router router;
    EXPECT_THROW(router.add(http::verb::get, "/users/{id:guid}", [](const RequestContext&) {
        return makeEmpty(http::status::ok);
    }), InternalError);
}

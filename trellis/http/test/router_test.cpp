#include "trellis/router.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "trellis/handler-chain.hpp"
#include "trellis/http-method.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/test_request.hpp"

namespace trellis {

namespace {

struct Trace {
  std::vector<std::string> calls;
};

using TestRouter = Router<Trace>;

TestRouter::Units Tagged(std::string tag) {
  TestRouter::Units units;
  units.emplace_back([tag = std::move(tag)](Trace& trace, HttpRequest&, HttpResponse&) { trace.calls.push_back(tag); });
  return units;
}

// Runs the matched chain against a dummy request and returns the recorded tags.
std::vector<std::string> Run(const TestRouter::RouteMatch& match) {
  Trace trace;
  test::TestRequest request("GET", "/");
  HttpResponse resp;
  Next<Trace> next(match.handlers);
  next(trace, request.req(), resp);
  return trace.calls;
}

}  // namespace

class RouterTest : public ::testing::Test {
 protected:
  TestRouter router;
};

TEST_F(RouterTest, LiteralExactMatchHasNoParams) {
  router.add(http::Method::GET, "/health", Tagged("health"));
  auto match = router.findRoute(http::Method::GET, "/health");
  ASSERT_TRUE(match);
  EXPECT_TRUE(match->params.empty());
  EXPECT_EQ(Run(*match), std::vector<std::string>{"health"});
}

TEST_F(RouterTest, LiteralPreferredOverParam) {
  router.add(http::Method::GET, "/users/:id", Tagged("byId"));
  router.add(http::Method::GET, "/users/me", Tagged("me"));

  auto me = router.findRoute(http::Method::GET, "/users/me");
  ASSERT_TRUE(me);
  EXPECT_EQ(Run(*me), std::vector<std::string>{"me"});
  EXPECT_TRUE(me->params.empty());

  auto byId = router.findRoute(http::Method::GET, "/users/42");
  ASSERT_TRUE(byId);
  EXPECT_EQ(Run(*byId), std::vector<std::string>{"byId"});
  EXPECT_EQ(byId->params.find("id"), std::optional<std::string_view>("42"));
}

TEST_F(RouterTest, MultipleParamsCaptured) {
  router.add(http::Method::GET, "/a/:x/b/:y", Tagged("ab"));
  auto match = router.findRoute(http::Method::GET, "/a/1/b/2");
  ASSERT_TRUE(match);
  EXPECT_EQ(match->params.size(), 2U);
  EXPECT_EQ(match->params.find("x"), std::optional<std::string_view>("1"));
  EXPECT_EQ(match->params.find("y"), std::optional<std::string_view>("2"));
}

TEST_F(RouterTest, UnregisteredMethodOrPathIsAbsent) {
  router.add(http::Method::GET, "/items", Tagged("items"));
  EXPECT_FALSE(router.findRoute(http::Method::POST, "/items"));
  EXPECT_FALSE(router.findRoute(http::Method::GET, "/other"));
  EXPECT_FALSE(router.findRoute(http::Method::GET, "/items/extra"));
}

TEST_F(RouterTest, IntermediateNodeWithoutHandlersIsAbsent) {
  router.add(http::Method::GET, "/api/v1/items", Tagged("items"));
  EXPECT_FALSE(router.findRoute(http::Method::GET, "/api/v1"));
  EXPECT_FALSE(router.findRoute(http::Method::GET, "/"));
}

TEST_F(RouterTest, NoBacktrackingAfterParamBranch) {
  // '/files/:name' is taken for '/files/x', so '/files/x/raw' cannot fall back to another branch.
  router.add(http::Method::GET, "/files/:name", Tagged("file"));
  router.add(http::Method::GET, "/files/static/raw", Tagged("raw"));
  EXPECT_FALSE(router.findRoute(http::Method::GET, "/files/x/raw"));
  auto raw = router.findRoute(http::Method::GET, "/files/static/raw");
  ASSERT_TRUE(raw);
  EXPECT_EQ(Run(*raw), std::vector<std::string>{"raw"});
}

TEST_F(RouterTest, RootPath) {
  router.add(http::Method::GET, "/", Tagged("root"));
  auto match = router.findRoute(http::Method::GET, "/");
  ASSERT_TRUE(match);
  EXPECT_EQ(Run(*match), std::vector<std::string>{"root"});
}

TEST_F(RouterTest, EmptySegmentsIgnored) {
  router.add(http::Method::GET, "/users/:id", Tagged("user"));
  auto match = router.findRoute(http::Method::GET, "//users//7/");
  ASSERT_TRUE(match);
  EXPECT_EQ(match->params.find("id"), std::optional<std::string_view>("7"));
}

TEST_F(RouterTest, GlobalMiddlewarePrependedInOrder) {
  router.use([](Trace& trace, HttpRequest& req, HttpResponse& resp, Next<Trace>& next) {
    trace.calls.emplace_back("mw1");
    next(trace, req, resp);
  });
  router.use([](Trace& trace, HttpRequest& req, HttpResponse& resp, Next<Trace>& next) {
    trace.calls.emplace_back("mw2");
    next(trace, req, resp);
  });
  router.add(http::Method::GET, "/x", Tagged("x"));
  auto match = router.findRoute(http::Method::GET, "/x");
  ASSERT_TRUE(match);
  EXPECT_EQ(match->handlers.size(), 3U);
  EXPECT_EQ(router.globalMiddleware().size(), 2U);
  EXPECT_EQ(Run(*match), (std::vector<std::string>{"mw1", "mw2", "x"}));
}

TEST_F(RouterTest, ReRegistrationReplacesHandlers) {
  router.add(http::Method::GET, "/x", Tagged("first"));
  router.add(http::Method::GET, "/x", Tagged("second"));
  auto match = router.findRoute(http::Method::GET, "/x");
  ASSERT_TRUE(match);
  EXPECT_EQ(Run(*match), std::vector<std::string>{"second"});
}

TEST_F(RouterTest, ParamRenamedByLastRegistration) {
  router.add(http::Method::GET, "/users/:id", Tagged("byId"));
  router.add(http::Method::GET, "/users/:userId/posts", Tagged("posts"));
  auto match = router.findRoute(http::Method::GET, "/users/5");
  ASSERT_TRUE(match);
  EXPECT_FALSE(match->params.contains("id"));
  EXPECT_EQ(match->params.find("userId"), std::optional<std::string_view>("5"));
}

TEST_F(RouterTest, MethodsHaveSeparateTrees) {
  router.add(http::Method::GET, "/res", Tagged("get"));
  router.add(http::Method::DELETE, "/res", Tagged("delete"));
  auto del = router.findRoute(http::Method::DELETE, "/res");
  ASSERT_TRUE(del);
  EXPECT_EQ(Run(*del), std::vector<std::string>{"delete"});
}

TEST_F(RouterTest, EmptyParamNameThrows) {
  EXPECT_THROW(router.add(http::Method::GET, "/users/:", Tagged("bad")), std::invalid_argument);
}

}  // namespace trellis

#include "trellis/http-response.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "trellis/http-status-code.hpp"

struct CreatedUser {
  int id;
  std::string name;
};

template <>
struct glz::meta<CreatedUser> {
  using T = CreatedUser;
  static constexpr auto value = glz::object("id", &T::id, "name", &T::name);
};

namespace trellis {

TEST(HttpResponse, DefaultsTo200WithoutBody) {
  HttpResponse resp;
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_FALSE(resp.hasBody());
  EXPECT_EQ(resp.serialize(), "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
}

TEST(HttpResponse, SerializeCreatedWithHeaderAndBody) {
  HttpResponse resp;
  resp.status(http::StatusCodeCreated).header("X-Request-Id", "abc").body("{\"a\":1}");
  EXPECT_EQ(resp.serialize(), "HTTP/1.1 201 Created\r\nX-Request-Id: abc\r\nContent-Length: 7\r\n\r\n{\"a\":1}");
}

TEST(HttpResponse, SendSetsTextPlain) {
  HttpResponse resp;
  resp.send("Not Found").status(http::StatusCodeNotFound);
  EXPECT_EQ(resp.serialize(),
            "HTTP/1.1 404 Not Found\r\nContent-Type: text/plain; charset=utf-8\r\nContent-Length: 9\r\n\r\nNot Found");
}

TEST(HttpResponse, SendJsonSetsContentType) {
  HttpResponse resp;
  resp.status(http::StatusCodeCreated).sendJson(CreatedUser{7, "ann"});
  EXPECT_EQ(resp.headerValue("content-type"), "application/json; charset=utf-8");
  EXPECT_EQ(resp.bodyView(), R"({"id":7,"name":"ann"})");
  EXPECT_NE(resp.serialize().find("Content-Length: 21\r\n"), std::string::npos);
}

TEST(HttpResponse, SendJsonEscapesStrings) {
  HttpResponse resp;
  resp.sendJson(CreatedUser{1, R"(a"b\c)"});
  EXPECT_EQ(resp.bodyView(), R"({"id":1,"name":"a\"b\\c"})");
}

TEST(HttpResponse, HeadersKeepInsertionOrderAndDuplicates) {
  HttpResponse resp;
  resp.header("Set-Cookie", "a=1").header("X-Other", "v").header("Set-Cookie", "b=2");
  ASSERT_EQ(resp.headers().size(), 3U);
  EXPECT_EQ(resp.headerValue("set-cookie"), "a=1");
  EXPECT_EQ(resp.serialize(),
            "HTTP/1.1 200 OK\r\nSet-Cookie: a=1\r\nX-Other: v\r\nSet-Cookie: b=2\r\nContent-Length: 0\r\n\r\n");
}

TEST(HttpResponse, UserContentLengthIgnored) {
  HttpResponse resp;
  resp.header("Content-Length", "999").body("abc");
  EXPECT_EQ(resp.serialize(), "HTTP/1.1 200 OK\r\nContent-Length: 3\r\n\r\nabc");
}

TEST(HttpResponse, BorrowedAndOwnedBodies) {
  static constexpr std::string_view kStatic = "static payload";
  HttpResponse resp;
  resp.bodyStatic(kStatic);
  EXPECT_TRUE(resp.hasBody());
  EXPECT_FALSE(resp.ownsBody());
  EXPECT_EQ(resp.bodyView().data(), kStatic.data());

  resp.body(std::string("owned"));
  EXPECT_TRUE(resp.ownsBody());
  EXPECT_EQ(resp.bodyView(), "owned");
}

TEST(HttpResponse, NoContentHasNoBodyNorLength) {
  HttpResponse resp;
  resp.status(http::StatusCodeNoContent).body("ignored");
  EXPECT_EQ(resp.serialize(), "HTTP/1.1 204 No Content\r\n\r\n");
}

TEST(HttpResponse, HeadOmitsBodyButKeepsLength) {
  HttpResponse resp;
  resp.body("hello");
  EXPECT_EQ(resp.serialize(false), "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\n");
}

TEST(HttpResponse, UnknownStatusReason) {
  HttpResponse resp(599);
  EXPECT_EQ(resp.serialize(), "HTTP/1.1 599 Unknown\r\nContent-Length: 0\r\n\r\n");
}

TEST(HttpResponse, ResetRestoresDefaults) {
  HttpResponse resp;
  resp.status(http::StatusCodeBadRequest).header("X", "y").send("oops");
  resp.reset();
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_TRUE(resp.headers().empty());
  EXPECT_FALSE(resp.hasBody());
}

TEST(HttpStatusCode, ReasonPhrases) {
  EXPECT_EQ(http::ReasonPhrase(http::StatusCodeOK), "OK");
  EXPECT_EQ(http::ReasonPhrase(http::StatusCodeForbidden), "Forbidden");
  EXPECT_EQ(http::ReasonPhrase(http::StatusCodeInternalServerError), "Internal Server Error");
  EXPECT_EQ(http::ReasonPhrase(http::StatusCodePayloadTooLarge), "Payload Too Large");
  EXPECT_EQ(http::ReasonPhrase(100), "Continue");
  EXPECT_EQ(http::ReasonPhrase(503), "Service Unavailable");
  EXPECT_EQ(http::ReasonPhrase(42), "Unknown");
  EXPECT_EQ(http::ReasonPhrase(418), "Unknown");
}

}  // namespace trellis

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "trellis/body-reader.hpp"
#include "trellis/http-request.hpp"
#include "trellis/request-arena.hpp"
#include "trellis/request-head.hpp"

namespace trellis::test {

// Builds a raw HTTP/1.1 request. A Content-Length header is added when body is not empty.
std::string BuildRawRequest(std::string_view method, std::string_view target, std::string_view body = {},
                            const std::vector<std::pair<std::string, std::string>>& headers = {});

// Owns everything an HttpRequest references (raw bytes, arena, parsed head, body source), for unit tests that
// exercise handlers without a server.
class TestRequest {
 public:
  static constexpr std::string_view kPeerAddress = "127.0.0.1:40000";

  // Throws std::invalid_argument if rawRequest cannot be parsed.
  explicit TestRequest(std::string rawRequest);

  TestRequest(std::string_view method, std::string_view target, std::string_view body = {},
              const std::vector<std::pair<std::string, std::string>>& headers = {})
      : TestRequest(BuildRawRequest(method, target, body, headers)) {}

  TestRequest(const TestRequest&) = delete;
  TestRequest(TestRequest&&) = delete;
  TestRequest& operator=(const TestRequest&) = delete;
  TestRequest& operator=(TestRequest&&) = delete;

  ~TestRequest() = default;

  HttpRequest& req() noexcept { return _req; }

  RequestArena& arena() noexcept { return _arena; }

 private:
  std::string _raw;
  RequestArena _arena;
  RequestHead _head;
  BufferedBodySource _bodySource;
  HttpRequest _req;
};

}  // namespace trellis::test

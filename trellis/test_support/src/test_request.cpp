#include "trellis/test_request.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "trellis/body-reader.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-request.hpp"
#include "trellis/request-arena.hpp"
#include "trellis/request-head.hpp"

namespace trellis::test {

namespace {

RequestHead ParseOrThrow(std::string_view raw, RequestArena& arena) {
  auto head = ParseRequestHead(raw.substr(0, raw.find(http::DoubleCRLF)), arena.resource());
  if (!head) {
    throw std::invalid_argument("unparseable test request");
  }
  return std::move(*head);
}

std::string_view BodyOf(std::string_view raw) {
  const auto headerEnd = raw.find(http::DoubleCRLF);
  return headerEnd == std::string_view::npos ? std::string_view{} : raw.substr(headerEnd + http::DoubleCRLF.size());
}

}  // namespace

std::string BuildRawRequest(std::string_view method, std::string_view target, std::string_view body,
                            const std::vector<std::pair<std::string, std::string>>& headers) {
  std::string raw;
  raw.append(method).append(" ").append(target).append(" HTTP/1.1\r\nHost: localhost\r\n");
  for (const auto& [name, value] : headers) {
    raw.append(name).append(": ").append(value).append(http::CRLF);
  }
  if (!body.empty()) {
    raw.append("Content-Length: ").append(std::to_string(body.size())).append(http::CRLF);
  }
  raw.append(http::CRLF).append(body);
  return raw;
}

TestRequest::TestRequest(std::string rawRequest)
    : _raw(std::move(rawRequest)),
      _head(ParseOrThrow(_raw, _arena)),
      _bodySource(BodyOf(_raw)),
      _req(_head, BodyReader(_bodySource), kPeerAddress, _arena) {}

}  // namespace trellis::test

#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "trellis/http-constants.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/json-serializer.hpp"

namespace trellis {

// Response builder. Headers are append-only and serialized in insertion order.
// The body is either absent, borrowed (the caller guarantees the viewed bytes outlive serialization, typically
// static data or request arena memory) or owned by the response.
class HttpResponse {
 public:
  using Header = std::pair<std::string, std::string>;

  HttpResponse() noexcept = default;

  explicit HttpResponse(http::StatusCode statusCode) noexcept : _statusCode(statusCode) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _statusCode; }

  HttpResponse& status(http::StatusCode statusCode) noexcept {
    _statusCode = statusCode;
    return *this;
  }

  // Appends a header. An existing header with the same name is not replaced.
  // A user supplied Content-Length is ignored at serialization, the computed one wins.
  HttpResponse& header(std::string_view name, std::string_view value) {
    _headers.emplace_back(name, value);
    return *this;
  }

  [[nodiscard]] std::span<const Header> headers() const noexcept { return _headers; }

  // Case-insensitive lookup of the first header with the given name.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // Sets an owned body.
  HttpResponse& body(std::string body) {
    _body = std::move(body);
    return *this;
  }

  // Sets a borrowed body, not copied.
  HttpResponse& bodyStatic(std::string_view body) noexcept {
    _body = body;
    return *this;
  }

  [[nodiscard]] bool hasBody() const noexcept { return !std::holds_alternative<std::monostate>(_body); }

  [[nodiscard]] bool ownsBody() const noexcept { return std::holds_alternative<std::string>(_body); }

  [[nodiscard]] std::string_view bodyView() const noexcept;

  // Sets 'Content-Type: text/plain; charset=utf-8' and an owned copy of text as body.
  HttpResponse& send(std::string_view text);

  // Serializes value with glaze and sets it as body with 'Content-Type: application/json; charset=utf-8'.
  template <class T>
  HttpResponse& sendJson(const T& value) {
    header(http::ContentType, http::ContentTypeApplicationJson);
    return body(SerializeToJson(value));
  }

  // Back to a default constructed 200 response without headers nor body.
  void reset() noexcept;

  // Serializes into HTTP/1.1 wire format: status line, headers in insertion order, computed Content-Length,
  // empty line, body. With includeBody false (HEAD requests), the body bytes are omitted but the
  // Content-Length still reflects them.
  [[nodiscard]] std::string serialize(bool includeBody = true) const;

 private:
  http::StatusCode _statusCode{http::StatusCodeOK};
  std::vector<Header> _headers;
  std::variant<std::monostate, std::string_view, std::string> _body;
};

}  // namespace trellis

#pragma once

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include "trellis/body-reader.hpp"
#include "trellis/http-method.hpp"
#include "trellis/request-arena.hpp"
#include "trellis/request-head.hpp"
#include "trellis/string-map.hpp"

namespace trellis {

// Per-request view model. It references the connection's read buffer (through the RequestHead), the body source
// and the request arena, all of which must outlive it. It is only valid for the duration of one exchange.
class HttpRequest {
 public:
  // Parses the query string into the arena.
  HttpRequest(const RequestHead& head, BodyReader body, std::string_view peerAddress, RequestArena& arena);

  [[nodiscard]] http::Method method() const noexcept { return _head->method; }

  // Full request target, including the query string.
  [[nodiscard]] std::string_view target() const noexcept { return _head->target; }

  // Target up to the first '?', not percent-decoded.
  [[nodiscard]] std::string_view path() const noexcept { return _head->path; }

  [[nodiscard]] std::string_view version() const noexcept { return _head->version; }

  [[nodiscard]] std::string_view peerAddress() const noexcept { return _peerAddress; }

  [[nodiscard]] const StringMap& queryParams() const noexcept { return _queryParams; }

  [[nodiscard]] std::optional<std::string_view> queryParam(std::string_view key) const noexcept {
    return _queryParams.find(key);
  }

  [[nodiscard]] const StringMap& pathParams() const noexcept { return _pathParams; }

  [[nodiscard]] std::optional<std::string_view> pathParam(std::string_view name) const noexcept {
    return _pathParams.find(name);
  }

  // Case-insensitive lookup of the first header with the given name.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return _head->headerValue(name);
  }

  [[nodiscard]] std::span<const HeaderField> headers() const noexcept { return _head->headers; }

  // Declared Content-Length, 0 when absent.
  [[nodiscard]] std::size_t contentLength() const noexcept { return _head->contentLength; }

  [[nodiscard]] BodyReader& body() noexcept { return _body; }

  [[nodiscard]] bool wantsKeepAlive() const noexcept { return _head->wantsKeepAlive(); }

  // Memory resource of the request arena, for handlers that want request-scoped allocations.
  [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return _arena->resource(); }

  // Installs the parameters captured by the router.
  void setPathParams(StringMap&& params) { _pathParams = std::move(params); }

 private:
  const RequestHead* _head;
  BodyReader _body;
  std::string_view _peerAddress;
  RequestArena* _arena;
  StringMap _queryParams;
  StringMap _pathParams;
};

}  // namespace trellis

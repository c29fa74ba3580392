#pragma once

#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "trellis/http-method.hpp"

namespace trellis {

using HeaderField = std::pair<std::string_view, std::string_view>;

// Views over a parsed request line and header block. All string views point into the buffer
// given to ParseRequestHead, which must outlive the RequestHead.
struct RequestHead {
  explicit RequestHead(std::pmr::memory_resource* mr) : headers(mr) {}

  // Case-insensitive lookup of the first header with the given name.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // HTTP/1.1 defaults to keep-alive unless 'Connection: close', HTTP/1.0 defaults to close
  // unless 'Connection: keep-alive'.
  [[nodiscard]] bool wantsKeepAlive() const noexcept;

  http::Method method{http::Method::GET};
  std::string_view target;
  std::string_view path;
  std::string_view query;
  std::string_view version;
  std::pmr::vector<HeaderField> headers;
  std::size_t contentLength{0};
};

// Parses a request line and header block. headBlock may include or omit the final empty line.
// Returns std::nullopt for unparseable input (unknown method, missing version, header line without ':',
// invalid or conflicting Content-Length).
std::optional<RequestHead> ParseRequestHead(std::string_view headBlock, std::pmr::memory_resource* mr);

// Outcome of a Content-Length scan over a header block.
struct ContentLengthScan {
  enum class Status : uint8_t { Absent, Present, Invalid };

  Status status{Status::Absent};
  std::size_t value{0};
};

// Looks for a Content-Length header (case-insensitive) inside a raw header block without fully parsing it.
ContentLengthScan ScanContentLength(std::string_view headBlock) noexcept;

}  // namespace trellis

#include "trellis/request-head.hpp"

#include <charconv>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string_view>

#include "trellis/http-constants.hpp"
#include "trellis/http-method.hpp"
#include "trellis/string-equal-ignore-case.hpp"
#include "trellis/string-trim.hpp"

namespace trellis {

namespace {

std::optional<std::size_t> ParseContentLengthValue(std::string_view value) noexcept {
  value = TrimOws(value);
  if (value.empty()) {
    return std::nullopt;
  }
  std::size_t length = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return length;
}

// Splits the next CRLF-terminated line off 'block'. The last line may lack its terminator.
std::string_view NextLine(std::string_view& block) noexcept {
  const auto lineEnd = block.find(http::CRLF);
  std::string_view line = block.substr(0, lineEnd);
  block.remove_prefix(lineEnd == std::string_view::npos ? block.size() : lineEnd + http::CRLF.size());
  return line;
}

}  // namespace

std::optional<std::string_view> RequestHead::headerValue(std::string_view name) const noexcept {
  for (const auto& [headerName, headerValue] : headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return headerValue;
    }
  }
  return std::nullopt;
}

bool RequestHead::wantsKeepAlive() const noexcept {
  // Connection is a token list, e.g. 'keep-alive, Upgrade'.
  const auto connection = headerValue(http::Connection);
  if (version == http::HTTP10) {
    return connection && CaseInsensitiveFind(*connection, http::keepalive) != std::string_view::npos;
  }
  return !connection || CaseInsensitiveFind(*connection, http::close) == std::string_view::npos;
}

std::optional<RequestHead> ParseRequestHead(std::string_view headBlock, std::pmr::memory_resource* mr) {
  std::string_view requestLine = NextLine(headBlock);

  const auto firstSpace = requestLine.find(' ');
  const auto lastSpace = requestLine.rfind(' ');
  if (firstSpace == std::string_view::npos || firstSpace == lastSpace) {
    return std::nullopt;
  }

  RequestHead head(mr);

  const auto method = http::MethodFromString(requestLine.substr(0, firstSpace));
  if (!method) {
    return std::nullopt;
  }
  head.method = *method;
  head.target = requestLine.substr(firstSpace + 1, lastSpace - firstSpace - 1);
  head.version = requestLine.substr(lastSpace + 1);
  if (head.target.empty() || head.target.find(' ') != std::string_view::npos || !head.version.starts_with("HTTP/1.")) {
    return std::nullopt;
  }

  const auto questionMark = head.target.find('?');
  head.path = head.target.substr(0, questionMark);
  if (questionMark != std::string_view::npos) {
    head.query = head.target.substr(questionMark + 1);
  }

  bool contentLengthSeen = false;
  while (!headBlock.empty()) {
    std::string_view line = NextLine(headBlock);
    if (line.empty()) {
      break;
    }
    const auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      return std::nullopt;
    }
    std::string_view name = line.substr(0, colon);
    std::string_view value = TrimOws(line.substr(colon + 1));
    if (CaseInsensitiveEqual(name, http::ContentLength)) {
      const auto length = ParseContentLengthValue(value);
      if (!length || (contentLengthSeen && *length != head.contentLength)) {
        return std::nullopt;
      }
      contentLengthSeen = true;
      head.contentLength = *length;
    }
    head.headers.emplace_back(name, value);
  }

  return head;
}

ContentLengthScan ScanContentLength(std::string_view headBlock) noexcept {
  ContentLengthScan scan;
  // Skip the request line.
  NextLine(headBlock);
  while (!headBlock.empty()) {
    std::string_view line = NextLine(headBlock);
    if (line.empty()) {
      break;
    }
    const auto colon = line.find(':');
    if (colon == std::string_view::npos || !CaseInsensitiveEqual(line.substr(0, colon), http::ContentLength)) {
      continue;
    }
    const auto length = ParseContentLengthValue(line.substr(colon + 1));
    if (!length || (scan.status == ContentLengthScan::Status::Present && *length != scan.value)) {
      return {ContentLengthScan::Status::Invalid, 0};
    }
    scan.status = ContentLengthScan::Status::Present;
    scan.value = *length;
  }
  return scan;
}

}  // namespace trellis

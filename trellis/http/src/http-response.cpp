#include "trellis/http-response.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "trellis/http-constants.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/string-equal-ignore-case.hpp"

namespace trellis {

std::optional<std::string_view> HttpResponse::headerValue(std::string_view name) const noexcept {
  for (const auto& [headerName, headerValue] : _headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return std::string_view(headerValue);
    }
  }
  return std::nullopt;
}

std::string_view HttpResponse::bodyView() const noexcept {
  if (const auto* owned = std::get_if<std::string>(&_body)) {
    return *owned;
  }
  if (const auto* borrowed = std::get_if<std::string_view>(&_body)) {
    return *borrowed;
  }
  return {};
}

HttpResponse& HttpResponse::send(std::string_view text) {
  header(http::ContentType, http::ContentTypeTextPlain);
  return body(std::string(text));
}

void HttpResponse::reset() noexcept {
  _statusCode = http::StatusCodeOK;
  _headers.clear();
  _body = std::monostate{};
}

std::string HttpResponse::serialize(bool includeBody) const {
  const std::string_view bodyBytes = bodyView();
  const bool bodyAllowed = !http::StatusForbidsBody(_statusCode);
  const std::string contentLength = std::to_string(bodyAllowed ? bodyBytes.size() : 0);
  const std::string_view reason = http::ReasonPhrase(_statusCode);

  std::size_t totalSize = http::HTTP11.size() + 5U + reason.size() + http::CRLF.size();
  for (const auto& [name, value] : _headers) {
    totalSize += name.size() + 2U + value.size() + http::CRLF.size();
  }
  totalSize += http::ContentLength.size() + 2U + contentLength.size() + http::DoubleCRLF.size();
  if (includeBody && bodyAllowed) {
    totalSize += bodyBytes.size();
  }

  std::string out;
  out.reserve(totalSize);
  out.append(http::HTTP11).push_back(' ');
  out.append(std::to_string(_statusCode)).push_back(' ');
  out.append(reason).append(http::CRLF);
  for (const auto& [name, value] : _headers) {
    if (CaseInsensitiveEqual(name, http::ContentLength)) {
      continue;
    }
    out.append(name).append(": ").append(value).append(http::CRLF);
  }
  if (bodyAllowed) {
    out.append(http::ContentLength).append(": ").append(contentLength).append(http::CRLF);
  }
  out.append(http::CRLF);
  if (includeBody && bodyAllowed) {
    out.append(bodyBytes);
  }
  return out;
}

}  // namespace trellis

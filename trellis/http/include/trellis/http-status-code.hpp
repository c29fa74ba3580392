#pragma once

#include <cstdint>
#include <string_view>

namespace trellis::http {

// Any value in [100, 599] may be used as a status, the constants below are the ones the server itself
// and its bundled collaborators produce.
using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeCreated = 201;
inline constexpr StatusCode StatusCodeNoContent = 204;
inline constexpr StatusCode StatusCodeNotModified = 304;
inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeUnauthorized = 401;
inline constexpr StatusCode StatusCodeForbidden = 403;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodePayloadTooLarge = 413;
inline constexpr StatusCode StatusCodeInternalServerError = 500;

// Reason phrase written in the status line. "Unknown" for codes without a registered phrase.
std::string_view ReasonPhrase(StatusCode statusCode) noexcept;

// 1xx, 204 and 304 responses never carry a body nor a Content-Length.
constexpr bool StatusForbidsBody(StatusCode statusCode) noexcept {
  return statusCode < 200 || statusCode == StatusCodeNoContent || statusCode == StatusCodeNotModified;
}

}  // namespace trellis::http

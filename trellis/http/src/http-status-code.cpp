#include "trellis/http-status-code.hpp"

#include <algorithm>
#include <iterator>
#include <string_view>

namespace trellis::http {

namespace {

struct ReasonPhraseEntry {
  StatusCode statusCode;
  std::string_view phrase;
};

// Sorted by status code.
constexpr ReasonPhraseEntry kReasonPhrases[] = {
    {100, "Continue"},
    {101, "Switching Protocols"},
    {StatusCodeOK, "OK"},
    {StatusCodeCreated, "Created"},
    {202, "Accepted"},
    {StatusCodeNoContent, "No Content"},
    {301, "Moved Permanently"},
    {302, "Found"},
    {303, "See Other"},
    {StatusCodeNotModified, "Not Modified"},
    {307, "Temporary Redirect"},
    {308, "Permanent Redirect"},
    {StatusCodeBadRequest, "Bad Request"},
    {StatusCodeUnauthorized, "Unauthorized"},
    {StatusCodeForbidden, "Forbidden"},
    {StatusCodeNotFound, "Not Found"},
    {405, "Method Not Allowed"},
    {409, "Conflict"},
    {411, "Length Required"},
    {StatusCodePayloadTooLarge, "Payload Too Large"},
    {415, "Unsupported Media Type"},
    {422, "Unprocessable Entity"},
    {429, "Too Many Requests"},
    {StatusCodeInternalServerError, "Internal Server Error"},
    {501, "Not Implemented"},
    {502, "Bad Gateway"},
    {503, "Service Unavailable"},
};

static_assert(std::ranges::is_sorted(kReasonPhrases, {}, &ReasonPhraseEntry::statusCode));

}  // namespace

std::string_view ReasonPhrase(StatusCode statusCode) noexcept {
  const auto* it = std::ranges::lower_bound(kReasonPhrases, statusCode, {}, &ReasonPhraseEntry::statusCode);
  if (it == std::end(kReasonPhrases) || it->statusCode != statusCode) {
    return "Unknown";
  }
  return it->phrase;
}

}  // namespace trellis::http

#pragma once

#include <string_view>

namespace trellis::http {

inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

inline constexpr std::string_view HTTP10 = "HTTP/1.0";
inline constexpr std::string_view HTTP11 = "HTTP/1.1";

inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentDisposition = "Content-Disposition";

inline constexpr std::string_view close = "close";
inline constexpr std::string_view keepalive = "keep-alive";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain; charset=utf-8";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json; charset=utf-8";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

}  // namespace trellis::http

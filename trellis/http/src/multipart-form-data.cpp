#include "trellis/multipart-form-data.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "trellis/body-reader.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/string-equal-ignore-case.hpp"
#include "trellis/string-trim.hpp"

namespace trellis {
namespace {

constexpr std::string_view kMultipartMediaType{"multipart/form-data"};

std::string_view StripQuotes(std::string_view value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value.remove_prefix(1);
    value.remove_suffix(1);
  }
  return value;
}

// Fills name and filename from a 'form-data; name="x"; filename="y"' value.
void ParseContentDisposition(std::string_view headerValue, MultipartPartHeaders& headers) {
  std::string_view rest = TrimOws(headerValue);
  bool firstToken = true;
  while (!rest.empty()) {
    const auto semicolon = rest.find(';');
    const std::string_view token = TrimOws(rest.substr(0, semicolon));
    if (firstToken) {
      if (!CaseInsensitiveEqual(token, "form-data")) {
        throw MultipartError(MultipartError::Kind::MalformedPart, "multipart part must have Content-Disposition: form-data");
      }
      firstToken = false;
    } else if (const auto eq = token.find('='); eq != std::string_view::npos) {
      const std::string_view key = TrimOws(token.substr(0, eq));
      const std::string_view value = StripQuotes(TrimOws(token.substr(eq + 1)));
      if (CaseInsensitiveEqual(key, "name")) {
        headers.name.assign(value);
      } else if (CaseInsensitiveEqual(key, "filename")) {
        headers.filename.emplace(value);
      }
    }
    if (semicolon == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(semicolon + 1);
  }
}

}  // namespace

std::optional<std::string_view> ExtractBoundary(std::string_view contentType) {
  const auto semicolon = contentType.find(';');
  if (semicolon == std::string_view::npos ||
      !CaseInsensitiveEqual(TrimOws(contentType.substr(0, semicolon)), kMultipartMediaType)) {
    return std::nullopt;
  }
  std::string_view params = contentType.substr(semicolon + 1);
  while (!params.empty()) {
    const auto next = params.find(';');
    const std::string_view param = TrimOws(params.substr(0, next));
    const auto eq = param.find('=');
    if (eq != std::string_view::npos && CaseInsensitiveEqual(TrimOws(param.substr(0, eq)), "boundary")) {
      const std::string_view boundary = StripQuotes(TrimOws(param.substr(eq + 1)));
      if (boundary.empty()) {
        return std::nullopt;
      }
      return boundary;
    }
    if (next == std::string_view::npos) {
      break;
    }
    params.remove_prefix(next + 1);
  }
  return std::nullopt;
}

MultipartReader::MultipartReader(BodyReader& body, std::string_view boundary) : _body(&body) {
  _delimiter.reserve(http::CRLF.size() + 2U + boundary.size());
  _delimiter.append(http::CRLF).append("--").append(boundary);
}

bool MultipartReader::fill() {
  if (_pos > 0) {
    _buffer.erase(0, _pos);
    _pos = 0;
  }
  const std::size_t oldSize = _buffer.size();
  _buffer.resize(oldSize + kReadChunkSize);
  const std::size_t nbRead = _body->read(std::span<char>(_buffer.data() + oldSize, kReadChunkSize));
  _buffer.resize(oldSize + nbRead);
  return nbRead != 0;
}

bool MultipartReader::ensure(std::size_t n) {
  while (_buffer.size() - _pos < n) {
    if (!fill()) {
      return false;
    }
  }
  return true;
}

void MultipartReader::skipPreamble() {
  // The first delimiter may start the body, hence is not preceded by CRLF.
  const std::string_view dashBoundary = std::string_view(_delimiter).substr(http::CRLF.size());
  while (true) {
    const std::string_view data = std::string_view(_buffer).substr(_pos);
    const auto idx = data.find(dashBoundary);
    if (idx != std::string_view::npos) {
      _pos += idx + dashBoundary.size();
      _started = true;
      return;
    }
    if (data.size() >= dashBoundary.size()) {
      _pos += data.size() - (dashBoundary.size() - 1);
    }
    if (!fill()) {
      throw MultipartError(MultipartError::Kind::MalformedPart, "multipart body has no opening delimiter");
    }
  }
}

std::optional<MultipartPartHeaders> MultipartReader::nextPart() {
  if (_finished) {
    return std::nullopt;
  }
  if (!_started) {
    skipPreamble();
  } else if (_inPart) {
    streamPartContent([](std::string_view) {}, std::numeric_limits<std::size_t>::max());
  }

  if (!ensure(2)) {
    throw MultipartError(MultipartError::Kind::MalformedPart, "multipart body truncated after delimiter");
  }
  if (std::string_view(_buffer).substr(_pos).starts_with("--")) {
    _pos += 2;
    _finished = true;
    return std::nullopt;
  }
  if (!std::string_view(_buffer).substr(_pos).starts_with(http::CRLF)) {
    throw MultipartError(MultipartError::Kind::MalformedPart, "multipart delimiter not followed by CRLF");
  }
  _pos += http::CRLF.size();

  MultipartPartHeaders headers;
  bool dispositionSeen = false;
  std::size_t headerBytes = 0;
  while (true) {
    const std::string_view data = std::string_view(_buffer).substr(_pos);
    const auto lineEnd = data.find(http::CRLF);
    if (lineEnd == std::string_view::npos) {
      if (headerBytes + data.size() > kMaxPartHeaderBytes || !fill()) {
        throw MultipartError(MultipartError::Kind::MalformedPart, "multipart part headers malformed or too large");
      }
      continue;
    }
    const std::string_view line = data.substr(0, lineEnd);
    _pos += lineEnd + http::CRLF.size();
    headerBytes += lineEnd + http::CRLF.size();
    if (line.empty()) {
      break;
    }
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      throw MultipartError(MultipartError::Kind::MalformedPart, "multipart part header line without ':'");
    }
    const std::string_view name = TrimOws(line.substr(0, colon));
    const std::string_view value = TrimOws(line.substr(colon + 1));
    if (CaseInsensitiveEqual(name, http::ContentDisposition)) {
      ParseContentDisposition(value, headers);
      dispositionSeen = true;
    } else if (CaseInsensitiveEqual(name, http::ContentType)) {
      headers.contentType.emplace(value);
    }
  }

  if (!dispositionSeen || headers.name.empty()) {
    throw MultipartError(MultipartError::Kind::MissingPartName, "multipart part missing name parameter");
  }
  _inPart = true;
  return headers;
}

std::size_t MultipartReader::streamPartContent(const Writer& writer, std::size_t maxBytes) {
  if (!_inPart) {
    return 0;
  }
  std::size_t total = 0;
  const auto emit = [&](std::string_view chunk) {
    total += chunk.size();
    if (total > maxBytes) {
      throw MultipartError(MultipartError::Kind::PartTooLarge, "multipart part exceeds the allowed size");
    }
    if (!chunk.empty()) {
      writer(chunk);
    }
  };
  while (true) {
    const std::string_view data = std::string_view(_buffer).substr(_pos);
    const auto idx = data.find(_delimiter);
    if (idx != std::string_view::npos) {
      emit(data.substr(0, idx));
      _pos += idx + _delimiter.size();
      _inPart = false;
      return total;
    }
    // Keep a tail that could be the beginning of a delimiter split across reads.
    const std::size_t safe = data.size() >= _delimiter.size() ? data.size() - (_delimiter.size() - 1) : 0;
    emit(data.substr(0, safe));
    _pos += safe;
    if (!fill()) {
      throw MultipartError(MultipartError::Kind::MalformedPart, "multipart body ended inside a part");
    }
  }
}

std::string MultipartReader::readPartContent(std::size_t maxBytes) {
  std::string content;
  streamPartContent([&content](std::string_view chunk) { content.append(chunk); }, maxBytes);
  return content;
}

}  // namespace trellis

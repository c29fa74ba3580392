#include "trellis/static-file-handler.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "trellis/http-constants.hpp"
#include "trellis/http-method.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/http-status-code.hpp"
#include "trellis/log.hpp"
#include "trellis/string-equal-ignore-case.hpp"
#include "trellis/url-decode.hpp"

namespace trellis {

namespace {

struct MIMEMapping {
  std::string_view extension;
  std::string_view mimeType;
};

constexpr MIMEMapping kMIMEMappings[] = {
    {"css", "text/css"},
    {"gif", "image/gif"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"ico", "image/x-icon"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"js", "application/javascript"},
    {"json", "application/json"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"svg", "image/svg+xml"},
    {"txt", "text/plain"},
    {"wasm", "application/wasm"},
    {"xml", "application/xml"},
};

bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& candidate) {
  const auto [rootIt, candidateIt] = std::mismatch(root.begin(), root.end(), candidate.begin(), candidate.end());
  return rootIt == root.end();
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Unable to open " + path.string());
  }
  std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw std::runtime_error("Unable to read " + path.string());
  }
  return content;
}

}  // namespace

StaticFileHandler::StaticFileHandler(const std::filesystem::path& root) : _root(std::filesystem::canonical(root)) {
  log::debug("Serving static files from {}", _root.string());
}

std::string_view StaticFileHandler::MimeTypeFor(const std::filesystem::path& path) {
  std::string ext = path.extension().string();
  if (ext.size() > 1) {
    std::string_view extension = std::string_view(ext).substr(1);
    for (const auto& mapping : kMIMEMappings) {
      if (CaseInsensitiveEqual(mapping.extension, extension)) {
        return mapping.mimeType;
      }
    }
  }
  return http::ContentTypeApplicationOctetStream;
}

bool StaticFileHandler::handle(const HttpRequest& req, HttpResponse& resp) const {
  if (req.method() != http::Method::GET && req.method() != http::Method::HEAD) {
    return false;
  }

  std::string relative(req.path());
  char* decodedEnd = url::DecodeInPlace(relative.data(), relative.data() + relative.size());
  if (decodedEnd == nullptr) {
    return false;
  }
  relative.resize(static_cast<std::size_t>(decodedEnd - relative.data()));
  const auto firstNonSlash = relative.find_first_not_of('/');
  if (firstNonSlash == std::string::npos) {
    return false;
  }
  relative.erase(0, firstNonSlash);

  std::error_code ec;
  const std::filesystem::path resolved = std::filesystem::canonical(_root / relative, ec);
  if (ec) {
    return false;
  }
  if (!IsWithin(_root, resolved)) {
    log::warn("Static path {} resolves outside of {}", req.path(), _root.string());
    resp.status(http::StatusCodeForbidden).send("Access denied");
    return true;
  }
  if (!std::filesystem::is_regular_file(resolved, ec)) {
    return false;
  }

  resp.status(http::StatusCodeOK).header(http::ContentType, MimeTypeFor(resolved)).body(ReadFile(resolved));
  return true;
}

}  // namespace trellis

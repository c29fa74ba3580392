#pragma once

#include <filesystem>
#include <string_view>

#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"

namespace trellis {

// Serves files below a root directory, as a pre-route handler.
//
// Containment is checked on canonical paths: the target is percent-decoded, joined to the root and resolved
// (symlinks and '..' included), then compared component-wise with the canonical root. Any resolution escaping
// the root yields 403, whatever the raw target looked like.
class StaticFileHandler {
 public:
  // Throws std::filesystem::filesystem_error if root does not exist.
  explicit StaticFileHandler(const std::filesystem::path& root);

  // Returns true when the request was answered (file content, or 403 for an escaping path).
  // Returns false for non GET/HEAD methods, missing files, directories and undecodable targets,
  // letting the caller continue with routing.
  // Throws std::runtime_error if an existing file cannot be read.
  bool handle(const HttpRequest& req, HttpResponse& resp) const;

  [[nodiscard]] const std::filesystem::path& root() const noexcept { return _root; }

  // MIME type from the file extension, application/octet-stream when unknown.
  static std::string_view MimeTypeFor(const std::filesystem::path& path);

 private:
  std::filesystem::path _root;
};

}  // namespace trellis

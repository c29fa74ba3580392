#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "trellis/http-request.hpp"

namespace trellis {

struct UploadedFile {
  std::string fieldName;
  std::string originalFilename;
  std::string contentType;
  std::filesystem::path savedPath;
  std::size_t size{0};
};

struct UploadResult {
  std::vector<UploadedFile> files;
  std::vector<std::pair<std::string, std::string>> fields;
};

// Streams the file parts of a multipart/form-data request to disk.
// Each file part is written to '<uploadDir>/upload_<epoch millis>_<sequence><extension>', the extension being
// taken from the client supplied filename when it is a short alphanumeric one.
class FileUploadHandler {
 public:
  static constexpr std::size_t kDefaultMaxFileBytes = 50UL * 1024UL * 1024UL;
  static constexpr std::size_t kMaxFieldBytes = 64UL * 1024UL;

  // Creates uploadDir if needed. Throws std::filesystem::filesystem_error on failure.
  explicit FileUploadHandler(std::filesystem::path uploadDir, std::size_t maxFileBytes = kDefaultMaxFileBytes);

  // Consumes the request body.
  // Throws MultipartError: MissingBoundary if the request is not multipart/form-data, PartTooLarge if a file
  // exceeds the per-file ceiling (its partial file is removed), MalformedPart / MissingPartName on bad input.
  // Throws std::system_error if a file cannot be written.
  UploadResult process(HttpRequest& req) const;

  [[nodiscard]] const std::filesystem::path& uploadDir() const noexcept { return _uploadDir; }

  [[nodiscard]] std::size_t maxFileBytes() const noexcept { return _maxFileBytes; }

 private:
  std::filesystem::path _uploadDir;
  std::size_t _maxFileBytes;
};

}  // namespace trellis

#include "trellis/file-upload-handler.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "trellis/base-fd.hpp"
#include "trellis/errno-throw.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-request.hpp"
#include "trellis/log.hpp"
#include "trellis/multipart-form-data.hpp"

namespace trellis {

namespace {

constexpr std::size_t kMaxExtensionLength = 10;

std::atomic<uint64_t> gUploadSequence{0};

std::string SafeExtension(std::string_view filename) {
  std::string ext = std::filesystem::path(filename).extension().string();
  if (ext.size() < 2 || ext.size() > kMaxExtensionLength + 1 ||
      !std::all_of(ext.begin() + 1, ext.end(), [](unsigned char ch) { return std::isalnum(ch) != 0; })) {
    return {};
  }
  return ext;
}

std::filesystem::path NextUploadPath(const std::filesystem::path& dir, std::string_view filename) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch());
  std::string name("upload_");
  name.append(std::to_string(millis.count())).push_back('_');
  name.append(std::to_string(gUploadSequence.fetch_add(1, std::memory_order_relaxed)));
  name.append(SafeExtension(filename));
  return dir / name;
}

void WriteAll(const BaseFd& file, std::string_view data, const std::filesystem::path& path) {
  while (!data.empty()) {
    const auto written = ::write(file.fd(), data.data(), data.size());
    if (written == -1) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno("write to {} failed", path.string());
    }
    data.remove_prefix(static_cast<std::size_t>(written));
  }
}

}  // namespace

FileUploadHandler::FileUploadHandler(std::filesystem::path uploadDir, std::size_t maxFileBytes)
    : _uploadDir(std::move(uploadDir)), _maxFileBytes(maxFileBytes) {
  std::filesystem::create_directories(_uploadDir);
}

UploadResult FileUploadHandler::process(HttpRequest& req) const {
  const auto contentType = req.headerValue(http::ContentType);
  const auto boundary = contentType ? ExtractBoundary(*contentType) : std::nullopt;
  if (!boundary) {
    throw MultipartError(MultipartError::Kind::MissingBoundary, "request is not multipart/form-data with a boundary");
  }

  UploadResult result;
  MultipartReader reader(req.body(), *boundary);
  while (auto part = reader.nextPart()) {
    if (!part->filename) {
      result.fields.emplace_back(std::move(part->name), reader.readPartContent(kMaxFieldBytes));
      continue;
    }

    UploadedFile uploaded;
    uploaded.fieldName = std::move(part->name);
    uploaded.originalFilename = std::move(*part->filename);
    uploaded.contentType = part->contentType.value_or(std::string(http::ContentTypeApplicationOctetStream));
    uploaded.savedPath = NextUploadPath(_uploadDir, uploaded.originalFilename);

    {
      BaseFd file(::open(uploaded.savedPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
      if (!file) {
        throw_errno("Unable to create {}", uploaded.savedPath.string());
      }
      try {
        uploaded.size = reader.streamPartContent(
            [&](std::string_view chunk) { WriteAll(file, chunk, uploaded.savedPath); }, _maxFileBytes);
      } catch (const std::exception& ex) {
        file.close();
        std::error_code ec;
        std::filesystem::remove(uploaded.savedPath, ec);
        log::warn("Upload of '{}' aborted: {}", uploaded.originalFilename, ex.what());
        throw;
      }
    }

    log::info("Saved upload '{}' ({} bytes) to {}", uploaded.originalFilename, uploaded.size,
              uploaded.savedPath.string());
    result.files.push_back(std::move(uploaded));
  }
  return result;
}

}  // namespace trellis

#pragma once

#include <filesystem>
#include <string_view>

namespace trellis::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (recursively) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "trellis-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Writes a file relative to the directory, creating intermediate directories. Returns its full path.
  std::filesystem::path writeFile(const std::filesystem::path& relativePath, std::string_view content) const;

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

}  // namespace trellis::test

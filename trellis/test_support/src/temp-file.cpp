#include "trellis/temp-file.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "trellis/log.hpp"

namespace trellis::test {

namespace {
std::string toHex(uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(16);
  for (int i = 15; i >= 0; --i) {
    out.push_back(kHex[(value >> (i * 4)) & 0xF]);
  }
  return out;
}

std::mt19937_64& threadRng() {
  thread_local std::mt19937_64 engine = [] {
    std::random_device rd;
    const auto now = static_cast<uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const auto tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    std::array<uint64_t, 3> seeds{static_cast<uint64_t>(rd()), now, tid};
    std::seed_seq seq(seeds.begin(), seeds.end());
    return std::mt19937_64(seq);
  }();
  return engine;
}
}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  std::uniform_int_distribution<uint64_t> dist;
  for (int attempt = 0; attempt < 100; ++attempt) {
    const auto candidate = base / (std::string(prefix) + toHex(dist(threadRng())));
    std::error_code ec;
    if (std::filesystem::create_directories(candidate, ec)) {
      _dir = candidate;
      return;
    }
  }
  throw std::runtime_error("ScopedTempDir: Failed to create temp dir");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

std::filesystem::path ScopedTempDir::writeFile(const std::filesystem::path& relativePath,
                                               std::string_view content) const {
  const auto fullPath = _dir / relativePath;
  std::filesystem::create_directories(fullPath.parent_path());
  std::ofstream out(fullPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("ScopedTempDir: unable to create " + fullPath.string());
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  return fullPath;
}

void ScopedTempDir::cleanup() noexcept {
  if (_dir.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(_dir, ec);
  if (ec) {
    log::warn("Unable to remove temporary directory {}: {}", _dir.string(), ec.message());
  }
  _dir.clear();
}

}  // namespace trellis::test

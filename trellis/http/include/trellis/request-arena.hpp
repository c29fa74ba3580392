#pragma once

#include <array>
#include <cstddef>
#include <memory_resource>

namespace trellis {

// Region allocator backing all temporary data derived from one request (decoded query, path parameters,
// route match, header index). Everything allocated from it is released at once when the arena is destroyed,
// so no derived data may outlive the request/response exchange that created the arena.
class RequestArena {
 public:
  static constexpr std::size_t kInlineBytes = 2048;

  RequestArena() noexcept : _resource(_inline.data(), _inline.size()) {}

  RequestArena(const RequestArena&) = delete;
  RequestArena(RequestArena&&) = delete;
  RequestArena& operator=(const RequestArena&) = delete;
  RequestArena& operator=(RequestArena&&) = delete;

  ~RequestArena() = default;

  [[nodiscard]] std::pmr::memory_resource* resource() noexcept { return &_resource; }

 private:
  alignas(std::max_align_t) std::array<std::byte, kInlineBytes> _inline;
  std::pmr::monotonic_buffer_resource _resource;
};

}  // namespace trellis

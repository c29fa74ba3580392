#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include "trellis/body-reader.hpp"

namespace trellis {

// Body of a request read from a blocking socket. Bytes already received past the header block are served first.
class SocketBodySource final : public BodySource {
 public:
  SocketBodySource(int fd, std::string_view prefetched, std::size_t contentLength) noexcept
      : _prefetched(prefetched), _fd(fd), _remaining(contentLength) {}

  // Throws std::system_error on recv failure, std::runtime_error if the peer closes before the end of the body.
  std::size_t read(std::span<char> out) override;

  [[nodiscard]] std::size_t remaining() const noexcept override { return _remaining; }

  // Number of prefetched bytes that belong to this body and have been consumed so far.
  [[nodiscard]] std::size_t prefetchedConsumed() const noexcept { return _prefetchedConsumed; }

  // Discards the unread part of the body. Returns false if the connection failed meanwhile.
  bool drain() noexcept;

 private:
  std::string_view _prefetched;
  std::size_t _prefetchedConsumed{0};
  int _fd;
  std::size_t _remaining;
};

}  // namespace trellis

#pragma once

#include <cstdint>

#include "trellis/base-fd.hpp"

namespace trellis {

// RAII listening TCP socket bound to the IPv4 loopback address.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Construct a socket with the given type.
  // Throws std::system_error on failure.
  explicit Socket(Type type);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to 127.0.0.1 and start listening on the given port (SO_REUSEADDR always set).
  // If port is 0, an ephemeral port is chosen and written back into the argument.
  // Throws std::system_error on failure.
  void bindAndListen(bool reusePort, uint16_t& port);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace trellis

#include "socket-body-source.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstddef>
#include <exception>
#include <span>
#include <stdexcept>

#include "trellis/errno-throw.hpp"
#include "trellis/log.hpp"
#include "trellis/socket-ops.hpp"

namespace trellis {

std::size_t SocketBodySource::read(std::span<char> out) {
  const std::size_t want = std::min(out.size(), _remaining);
  if (want == 0) {
    return 0;
  }
  const std::size_t prefetchedLeft = _prefetched.size() - _prefetchedConsumed;
  if (prefetchedLeft != 0) {
    const std::size_t nbCopied = std::min(want, prefetchedLeft);
    std::copy_n(_prefetched.data() + _prefetchedConsumed, nbCopied, out.data());
    _prefetchedConsumed += nbCopied;
    _remaining -= nbCopied;
    return nbCopied;
  }
  const auto nbRead = SafeRecv(_fd, out.data(), want);
  if (nbRead < 0) {
    throw_errno("recv failed on fd # {} while reading request body", _fd);
  }
  if (nbRead == 0) {
    throw std::runtime_error("connection closed before the end of the request body");
  }
  _remaining -= static_cast<std::size_t>(nbRead);
  return static_cast<std::size_t>(nbRead);
}

bool SocketBodySource::drain() noexcept {
  std::array<char, 4096> sink;
  try {
    while (_remaining != 0) {
      read(sink);
    }
  } catch (const std::exception& ex) {
    log::debug("Unable to drain request body on fd # {}: {}", _fd, ex.what());
    return false;
  }
  return true;
}

}  // namespace trellis

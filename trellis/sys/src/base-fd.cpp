#include "trellis/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "trellis/log.hpp"

namespace trellis {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd == kClosedFd) {
    return;
  }
  // Linux releases the descriptor even when close() is interrupted, so EINTR must not be retried:
  // the number may already belong to a descriptor opened by another thread.
  if (::close(_fd) != 0 && errno != EINTR) {
    log::error("close fd # {} failed: {}", _fd, std::strerror(errno));
  } else {
    log::debug("fd # {} closed", _fd);
  }
  _fd = kClosedFd;
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace trellis

#include "trellis/socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>

#include "trellis/errno-throw.hpp"
#include "trellis/log.hpp"

namespace trellis {

namespace {

constexpr int kListenBacklog = SOMAXCONN;

int ToSysType(Socket::Type type) {
  switch (type) {
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC;
    default:
      return SOCK_STREAM | SOCK_CLOEXEC;
  }
}

}  // namespace

Socket::Socket(Type type) : _baseFd(::socket(AF_INET, ToSysType(type), 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(bool reusePort, uint16_t& port) {
  static constexpr int kEnable = 1;
  const int fd = _baseFd.fd();
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) < 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  if (reusePort && ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) < 0) {
    throw_errno("setsockopt(SO_REUSEPORT) failed");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(port);
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw_errno("bind failed on port {}", port);
  }
  if (::listen(fd, kListenBacklog) != 0) {
    throw_errno("listen failed on port {}", port);
  }
  if (port == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&actual), &len) != 0) {
      throw_errno("getsockname failed");
    }
    port = ntohs(actual.sin_port);
  }
}

}  // namespace trellis

#include "trellis/socket-ops.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace trellis {

bool SetTcpNoDelay(int fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

std::string FormatAddress(const sockaddr_storage& addr) {
  std::array<char, INET6_ADDRSTRLEN> host{};
  uint16_t port = 0;
  if (addr.ss_family == AF_INET) {
    const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
    ::inet_ntop(AF_INET, &in->sin_addr, host.data(), host.size());
    port = ntohs(in->sin_port);
  } else if (addr.ss_family == AF_INET6) {
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
    ::inet_ntop(AF_INET6, &in6->sin6_addr, host.data(), host.size());
    port = ntohs(in6->sin6_port);
  } else {
    return "unknown";
  }
  std::string out(host.data());
  out.push_back(':');
  out.append(std::to_string(port));
  return out;
}

int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept {
  return static_cast<int64_t>(::send(fd, data, len, MSG_NOSIGNAL));
}

int64_t SafeRecv(int fd, void* data, std::size_t len) noexcept {
  while (true) {
    const auto nbBytes = ::recv(fd, data, len, 0);
    if (nbBytes == -1 && errno == EINTR) {
      continue;
    }
    return static_cast<int64_t>(nbBytes);
  }
}

bool SendAll(int fd, std::string_view data) noexcept {
  while (!data.empty()) {
    const auto sent = SafeSend(fd, data);
    if (sent == -1) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
  return true;
}

bool ShutdownReadWrite(int fd) noexcept { return ::shutdown(fd, SHUT_RDWR) == 0; }

}  // namespace trellis

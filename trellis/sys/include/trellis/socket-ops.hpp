#pragma once

#include <sys/socket.h>  // sockaddr_storage

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace trellis {

// Thin wrappers centralising socket system calls so that higher-level modules
// never call networking primitives directly.

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
// Returns true on success.
bool SetTcpNoDelay(int fd) noexcept;

// Render an IPv4 / IPv6 address as "host:port". Unknown families yield "unknown".
std::string FormatAddress(const sockaddr_storage& addr);

// Send data on a connected socket with MSG_NOSIGNAL.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(int fd, std::string_view data) noexcept { return SafeSend(fd, data.data(), data.size()); }

// Receive up to len bytes. Returns the number of bytes read, 0 on orderly shutdown,
// or -1 on error (errno is set). EINTR is retried internally.
int64_t SafeRecv(int fd, void* data, std::size_t len) noexcept;

// Send the whole buffer on a blocking socket, retrying on partial writes and EINTR.
// Returns false on error (errno is set).
bool SendAll(int fd, std::string_view data) noexcept;

// Shutdown both read and write halves of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownReadWrite(int fd) noexcept;

}  // namespace trellis

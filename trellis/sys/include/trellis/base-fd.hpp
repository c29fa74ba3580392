#pragma once

namespace trellis {

// Owner of a file descriptor (socket, epoll instance, pipe end, file), closed on destruction.
// Move-only: moving transfers ownership and leaves the source closed.
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  explicit BaseFd(int fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd& other) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd& other) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Gives up ownership without closing. The caller becomes responsible for the returned fd.
  [[nodiscard]] int release() noexcept;

  // Closes now. No-op if already closed.
  void close() noexcept;

  bool operator==(const BaseFd&) const noexcept = default;

 private:
  int _fd;
};

}  // namespace trellis

#pragma once

#include <chrono>
#include <cstdint>
#include <span>

#include "trellis/base-fd.hpp"
#include "trellis/event.hpp"

namespace trellis {

// Thin RAII wrapper over an epoll instance that may be shared by several worker threads.
//
// Design notes:
//  * The epoll descriptor and the poll timeout are the only shared state; add()/mod()/del()/poll() are safe
//    to call concurrently from several threads.
//  * Each polling thread owns its own EventLoop::Buffer receiving the ready events. The buffer starts with
//    kInitialCapacity (64) slots and doubles whenever a poll returns exactly capacity() events. It never shrinks.
//  * add()/mod()/del() return success/failure and log details on failure; caller decides policy
//    (e.g., drop connection / abort).
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    EventFd(int fd, EventBmp eventBmp) : eventBmp(eventBmp), fd(fd) {}

    EventBmp eventBmp;
    int fd;
  };

  // Per-thread storage for the events returned by poll().
  class Buffer {
   public:
    // initialCapacity values of 0 are promoted to 1.
    explicit Buffer(uint32_t initialCapacity = kInitialCapacity);

    Buffer(const Buffer&) = delete;
    Buffer(Buffer&& rhs) noexcept;
    Buffer& operator=(const Buffer&) = delete;
    Buffer& operator=(Buffer&& rhs) noexcept;

    ~Buffer();

    // Current allocated capacity (number of event slots available without reallocation).
    [[nodiscard]] uint32_t capacity() const noexcept { return _nbAllocatedEvents; }

   private:
    friend class EventLoop;

    uint32_t _nbAllocatedEvents = 0;
    void* _pEvents = nullptr;
  };

  // Creates the epoll instance.
  // Throws std::system_error if epoll_create1 fails.
  explicit EventLoop(std::chrono::milliseconds pollTimeout);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&&) noexcept = default;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&&) noexcept = default;

  ~EventLoop() = default;

  // Register fd with given events.
  // On error, throws std::system_error.
  void addOrThrow(EventFd event) const;

  // Register fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify fd with given events. Also re-arms a one-shot registration.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Delete fd from monitoring.
  // Log on error.
  void del(int fd) const;

  // Polls for ready events up to the poll timeout, storing them into the caller's buffer.
  //
  // Semantics:
  //  - On success: returns a non-empty span of ready events.
  //  - On timeout or when interrupted by a signal (EINTR): returns an empty span
  //    with non-null data() pointer.
  //  - On unrecoverable poll failure (already logged): returns an empty span
  //    with nullptr data() pointer.
  [[nodiscard]] std::span<const EventFd> poll(Buffer& buffer) const;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  int _pollTimeoutMs;
  BaseFd _baseFd;
};

}  // namespace trellis

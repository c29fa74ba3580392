#include "trellis/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <new>
#include <span>
#include <type_traits>
#include <utility>

#include "trellis/errno-throw.hpp"
#include "trellis/event.hpp"
#include "trellis/log.hpp"

namespace trellis {

namespace {

static_assert(std::is_trivially_copyable_v<epoll_event> && std::is_standard_layout_v<epoll_event>,
              "epoll_event must be trivially copyable for malloc / realloc usage");
static_assert(std::is_trivially_copyable_v<EventLoop::EventFd> && std::is_standard_layout_v<EventLoop::EventFd>,
              "EventLoop::EventFd must be trivially copyable for malloc / realloc usage");
static_assert(sizeof(epoll_event) >= sizeof(EventLoop::EventFd),
              "EventLoop requires epoll_event to be at least as large as EventFd for the convert loop");

static_assert(EventIn == EPOLLIN, "EventIn value mismatch");
static_assert(EventOut == EPOLLOUT, "EventOut value mismatch");
static_assert(EventErr == EPOLLERR, "EventErr value mismatch");
static_assert(EventHup == EPOLLHUP, "EventHup value mismatch");
static_assert(EventRdHup == EPOLLRDHUP, "EventRdHup value mismatch");
static_assert(EventOneShot == EPOLLONESHOT, "EventOneShot value mismatch");
static_assert(EventEt == EPOLLET, "EventEt value mismatch");

}  // namespace

EventLoop::Buffer::Buffer(uint32_t initialCapacity)
    : _nbAllocatedEvents(std::max(1U, initialCapacity)),
      _pEvents(std::malloc(static_cast<std::size_t>(_nbAllocatedEvents) * sizeof(epoll_event))) {
  if (_pEvents == nullptr) {
    throw std::bad_alloc();
  }
  if (initialCapacity == 0) {
    log::warn("EventLoop::Buffer constructed with initialCapacity=0; promoting to 1");
  }
}

EventLoop::Buffer::Buffer(Buffer&& rhs) noexcept
    : _nbAllocatedEvents(std::exchange(rhs._nbAllocatedEvents, 0)), _pEvents(std::exchange(rhs._pEvents, nullptr)) {}

EventLoop::Buffer& EventLoop::Buffer::operator=(Buffer&& rhs) noexcept {
  if (this != &rhs) [[likely]] {
    std::free(_pEvents);
    _nbAllocatedEvents = std::exchange(rhs._nbAllocatedEvents, 0);
    _pEvents = std::exchange(rhs._pEvents, nullptr);
  }
  return *this;
}

EventLoop::Buffer::~Buffer() { std::free(_pEvents); }

EventLoop::EventLoop(std::chrono::milliseconds pollTimeout)
    : _pollTimeoutMs(static_cast<int>(pollTimeout.count())), _baseFd(::epoll_create1(EPOLL_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("epoll_create1 failed");
  }
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

void EventLoop::addOrThrow(EventFd event) const {
  if (!add(event)) [[unlikely]] {
    throw_errno("epoll_ctl ADD failed (fd # {}, events=0x{:x})", event.fd, event.eventBmp);
  }
}

bool EventLoop::add(EventFd event) const {
  epoll_event ev{event.eventBmp, epoll_data_t{.fd = event.fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl ADD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
               std::strerror(err));
    errno = err;
    return false;
  }
  return true;
}

bool EventLoop::mod(EventFd event) const {
  epoll_event ev{event.eventBmp, epoll_data_t{.fd = event.fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_MOD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    // EBADF or ENOENT can occur during races where a connection is concurrently closed; downgrade severity.
    if (err == EBADF || err == ENOENT) {
      log::warn("epoll_ctl MOD benign failure (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp,
                err, std::strerror(err));
    } else {
      log::error("epoll_ctl MOD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
                 std::strerror(err));
    }
    return false;
  }
  return true;
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) [[unlikely]] {
    // DEL failures are usually benign if fd already closed; log at debug to avoid noise.
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, std::strerror(err));
  }
}

std::span<const EventLoop::EventFd> EventLoop::poll(Buffer& buffer) const {
  const uint32_t capacityBeforePoll = buffer._nbAllocatedEvents;
  auto* epollEvents = static_cast<epoll_event*>(buffer._pEvents);

  const int nbReadyFds = ::epoll_wait(_baseFd.fd(), epollEvents, static_cast<int>(capacityBeforePoll), _pollTimeoutMs);

  if (nbReadyFds == -1) {
    if (errno == EINTR) {
      return {std::launder(reinterpret_cast<EventFd*>(buffer._pEvents)), 0U};
    }
    const auto err = errno;
    log::error("epoll_wait failed (timeout_ms={}, errno={}, msg={})", _pollTimeoutMs, err, std::strerror(err));
    return {};
  }

  // Convert epoll_event[] into EventFd[] in-place (EventFd is smaller or equal in size/alignment).
  // Done before a possible growth so that realloc preserves the converted prefix.
  EventFd* out = std::launder(reinterpret_cast<EventFd*>(buffer._pEvents));
  for (int idx = 0; idx < nbReadyFds; ++idx) {
    const epoll_event ev = epollEvents[idx];
    out[idx] = EventFd{ev.data.fd, static_cast<EventBmp>(ev.events)};
  }

  if (std::cmp_equal(nbReadyFds, capacityBeforePoll)) {
    const uint32_t newCapacity = capacityBeforePoll * 2U;
    void* newEvents = std::realloc(buffer._pEvents, static_cast<std::size_t>(newCapacity) * sizeof(epoll_event));
    if (newEvents == nullptr) {
      log::error("Failed to reallocate memory for saturated events, keeping actual size of {}", capacityBeforePoll);
    } else {
      buffer._pEvents = newEvents;
      buffer._nbAllocatedEvents = newCapacity;
      out = std::launder(reinterpret_cast<EventFd*>(buffer._pEvents));
    }
  }

  return {out, static_cast<std::size_t>(nbReadyFds)};
}

}  // namespace trellis

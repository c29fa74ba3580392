#include "trellis/event-server.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "trellis/base-fd.hpp"
#include "trellis/body-reader.hpp"
#include "trellis/connection-state.hpp"
#include "trellis/event-loop.hpp"
#include "trellis/event.hpp"
#include "trellis/http-constants.hpp"
#include "trellis/http-method.hpp"
#include "trellis/http-request.hpp"
#include "trellis/http-response.hpp"
#include "trellis/log.hpp"
#include "trellis/request-arena.hpp"
#include "trellis/request-dispatcher.hpp"
#include "trellis/request-head.hpp"
#include "trellis/server-config.hpp"
#include "trellis/signal-handler.hpp"
#include "trellis/socket-ops.hpp"
#include "trellis/socket.hpp"

namespace trellis {

EventServer::EventServer(const ServerConfig& config, RequestDispatcher& dispatcher)
    : _config(config),
      _dispatcher(&dispatcher),
      _listenSocket(Socket::Type::StreamNonBlock),
      _eventLoop(config.pollInterval),
      _port(config.port) {
  _listenSocket.bindAndListen(_config.reusePort, _port);
  // Level-triggered: every worker woken for it drains the accept queue until EAGAIN.
  _eventLoop.addOrThrow(EventLoop::EventFd{_listenSocket.fd(), EventIn});
}

void EventServer::run() {
  log::info("Server listening on http://127.0.0.1:{} ({} mode)", _port, ServerModeToStr(ServerMode::EventDriven));
  log::debug("Starting {} workers", _config.nbWorkers);
  {
    std::vector<std::jthread> workers;
    workers.reserve(_config.nbWorkers - 1U);
    for (uint32_t workerId = 1; workerId < _config.nbWorkers; ++workerId) {
      workers.emplace_back([this, workerId] { workerLoop(workerId); });
    }
    workerLoop(0);
  }
  _connections.clear();
  log::info("Server on port {} stopped", _port);
}

void EventServer::workerLoop(uint32_t workerId) {
  log::debug("Worker {} started", workerId);
  EventLoop::Buffer events(_config.maxEventsPerPoll);
  std::string readBuffer(_config.readChunkBytes, '\0');
  while (!_stopRequested.load(std::memory_order_relaxed)) {
    if (SignalHandler::IsStopRequested()) {
      log::info("Worker {} received a termination signal, stopping the server", workerId);
      stop();
      break;
    }
    const auto ready = _eventLoop.poll(events);
    if (ready.data() == nullptr) [[unlikely]] {
      log::critical("Worker {} cannot poll anymore, stopping the server", workerId);
      stop();
      break;
    }
    for (const EventLoop::EventFd& event : ready) {
      try {
        if (event.fd == _listenSocket.fd()) {
          acceptNewConnections();
        } else {
          handleConnectionEvent(event.fd, event.eventBmp, readBuffer);
        }
      } catch (const std::exception& ex) {
        log::error("Worker {} failed on fd # {}: {}", workerId, event.fd, ex.what());
        if (event.fd != _listenSocket.fd()) {
          closeConnection(event.fd);
        }
      }
    }
  }
  log::debug("Worker {} stopped", workerId);
}

void EventServer::acceptNewConnections() {
  while (true) {
    sockaddr_storage addr{};
    socklen_t addrLen = sizeof(addr);
    const int fd =
        ::accept4(_listenSocket.fd(), reinterpret_cast<sockaddr*>(&addr), &addrLen, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd == -1) {
      const auto err = errno;
      if (err == EINTR || err == ECONNABORTED) {
        continue;
      }
      if (err != EAGAIN && err != EWOULDBLOCK) {
        log::error("accept4 failed on listening fd # {}: {}", _listenSocket.fd(), std::strerror(err));
      }
      return;
    }
    BaseFd connectionFd(fd);
    if (_config.tcpNoDelay && !SetTcpNoDelay(fd)) {
      log::warn("Unable to set TCP_NODELAY on fd # {}: {}", fd, std::strerror(errno));
    }
    std::string peerAddress = FormatAddress(addr);
    log::debug("Accepted fd # {} from {}", fd, peerAddress);

    // Registered in the table before epoll so that any worker receiving its first event finds it.
    _connections.insert(std::make_unique<ConnectionState>(std::move(connectionFd), std::move(peerAddress)));
    if (!_eventLoop.add(EventLoop::EventFd{fd, EventIn | kConnectionEvents})) {
      _connections.erase(fd);
    }
  }
}

void EventServer::handleConnectionEvent(int fd, EventBmp events, std::string& readBuffer) {
  ConnectionState* state = _connections.find(fd);
  if (state == nullptr) [[unlikely]] {
    log::debug("Event 0x{:x} for unknown fd # {}", events, fd);
    return;
  }
  if ((events & (EventErr | EventHup)) != 0) {
    log::debug("fd # {} error or hang up (events=0x{:x})", fd, events);
    closeConnection(fd);
    return;
  }
  if ((events & EventOut) != 0 && state->hasPendingOutput()) {
    handleWritable(*state);
    return;
  }
  if ((events & (EventIn | EventRdHup)) != 0) {
    handleReadable(*state, readBuffer);
  }
}

void EventServer::handleReadable(ConnectionState& state, std::string& readBuffer) {
  const int fd = state.fd.fd();
  while (true) {
    const auto nbRead = SafeRecv(fd, readBuffer.data(), readBuffer.size());
    if (nbRead > 0) {
      const std::string_view bytes(readBuffer.data(), static_cast<std::size_t>(nbRead));
      switch (state.feed(bytes, limits())) {
        case ConnectionState::FeedResult::NeedMore:
          continue;
        case ConnectionState::FeedResult::Ready:
          onRequestFramed(state);
          return;
        case ConnectionState::FeedResult::Abort:
          closeConnection(fd);
          return;
      }
    }
    if (nbRead == 0) {
      log::debug("fd # {} closed by peer", fd);
      closeConnection(fd);
      return;
    }
    const auto err = errno;
    if (err == EAGAIN || err == EWOULDBLOCK) {
      rearm(fd, EventIn);
      return;
    }
    log::error("recv failed on fd # {}: {}", fd, std::strerror(err));
    closeConnection(fd);
    return;
  }
}

void EventServer::onRequestFramed(ConnectionState& state) {
  if (!processRequest(state)) {
    closeConnection(state.fd.fd());
    return;
  }
  rearm(state.fd.fd(), EventOut);
}

bool EventServer::processRequest(ConnectionState& state) {
  RequestArena arena;
  const auto head = ParseRequestHead(state.headerBlock(), arena.resource());
  if (!head) {
    log::warn("fd # {} sent an unparseable request head, closing", state.fd.fd());
    return false;
  }

  BufferedBodySource bodySource(state.body());
  HttpRequest req(*head, BodyReader(bodySource), state.peerAddress, arena);
  HttpResponse resp;
  ProcessExchange(*_dispatcher, req, resp);

  state.keepAlive = _config.enableKeepAlive && head->wantsKeepAlive();
  if (!state.keepAlive) {
    resp.header(http::Connection, http::close);
  }
  state.queueOutput(resp.serialize(head->method != http::Method::HEAD));
  return true;
}

void EventServer::handleWritable(ConnectionState& state) {
  const int fd = state.fd.fd();
  while (state.hasPendingOutput()) {
    const auto sent = SafeSend(fd, state.pendingOutput());
    if (sent >= 0) {
      state.consumeOutput(static_cast<std::size_t>(sent));
      continue;
    }
    const auto err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err == EAGAIN || err == EWOULDBLOCK) {
      rearm(fd, EventOut);
      return;
    }
    log::debug("send failed on fd # {}: {}", fd, std::strerror(err));
    closeConnection(fd);
    return;
  }
  finishExchange(state);
}

void EventServer::finishExchange(ConnectionState& state) {
  const int fd = state.fd.fd();
  if (!state.keepAlive) {
    closeConnection(fd);
    return;
  }
  state.resetForNextExchange();
  // A pipelined request may already be fully buffered: no further readiness event would announce it.
  switch (state.advance(limits())) {
    case ConnectionState::FeedResult::Ready:
      onRequestFramed(state);
      break;
    case ConnectionState::FeedResult::Abort:
      closeConnection(fd);
      break;
    case ConnectionState::FeedResult::NeedMore:
      rearm(fd, EventIn);
      break;
  }
}

void EventServer::rearm(int fd, EventBmp interest) {
  if (!_eventLoop.mod(EventLoop::EventFd{fd, interest | kConnectionEvents})) {
    closeConnection(fd);
  }
}

void EventServer::closeConnection(int fd) {
  _eventLoop.del(fd);
  // Destroyed outside of the table lock, closing the fd.
  auto state = _connections.erase(fd);
  if (state) {
    log::debug("Connection fd # {} from {} closed", fd, state->peerAddress);
  }
}

}  // namespace trellis

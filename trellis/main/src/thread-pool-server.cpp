#include "trellis/thread-pool-server.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <exception>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "socket-body-source.hpp"
#include "trellis/base-fd.hpp"
#include "trellis/body-reader.hpp"
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

ThreadPoolServer::ThreadPoolServer(const ServerConfig& config, RequestDispatcher& dispatcher)
    : _config(config),
      _dispatcher(&dispatcher),
      _listenSocket(Socket::Type::StreamNonBlock),
      _eventLoop(config.pollInterval),
      _port(config.port) {
  _listenSocket.bindAndListen(_config.reusePort, _port);
  _eventLoop.addOrThrow(EventLoop::EventFd{_listenSocket.fd(), EventIn});
}

void ThreadPoolServer::run() {
  log::info("Server listening on http://127.0.0.1:{} ({} mode)", _port, ServerModeToStr(ServerMode::ThreadPool));
  log::debug("Starting {} pool threads", _config.nbPoolThreads);
  {
    std::vector<std::jthread> pool;
    pool.reserve(_config.nbPoolThreads);
    for (uint32_t threadPos = 0; threadPos < _config.nbPoolThreads; ++threadPos) {
      pool.emplace_back([this] { poolThreadLoop(); });
    }

    EventLoop::Buffer events(1);
    while (!isStopRequested()) {
      if (SignalHandler::IsStopRequested()) {
        log::info("Termination signal received, stopping the server");
        break;
      }
      const auto ready = _eventLoop.poll(events);
      if (ready.data() == nullptr) [[unlikely]] {
        log::critical("Cannot poll the listening socket anymore, stopping the server");
        stop();
        break;
      }
      if (!ready.empty()) {
        acceptNewConnections();
      }
    }
    // Makes sure pool threads observe the stop request even if it was set without stop().
    stop();
  }
  std::lock_guard<std::mutex> lock(_mutex);
  _pending.clear();
  log::info("Server on port {} stopped", _port);
}

void ThreadPoolServer::stop() noexcept {
  _stopRequested.store(true, std::memory_order_relaxed);
  {
    std::lock_guard<std::mutex> lock(_mutex);
    for (int fd : _activeFds) {
      ShutdownReadWrite(fd);
    }
  }
  _cv.notify_all();
}

void ThreadPoolServer::acceptNewConnections() {
  while (true) {
    sockaddr_storage addr{};
    socklen_t addrLen = sizeof(addr);
    // Accepted sockets are blocking, the listening one is not.
    const int fd = ::accept4(_listenSocket.fd(), reinterpret_cast<sockaddr*>(&addr), &addrLen, SOCK_CLOEXEC);
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
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _pending.push_back(PendingConnection{std::move(connectionFd), std::move(peerAddress)});
    }
    _cv.notify_one();
  }
}

void ThreadPoolServer::poolThreadLoop() {
  while (true) {
    PendingConnection connection;
    {
      std::unique_lock<std::mutex> lock(_mutex);
      _cv.wait(lock, [this] { return isStopRequested() || !_pending.empty(); });
      if (isStopRequested()) {
        return;
      }
      connection = std::move(_pending.front());
      _pending.pop_front();
      _activeFds.insert(connection.fd.fd());
    }
    try {
      serveConnection(connection);
    } catch (const std::exception& ex) {
      log::error("Error while serving fd # {} from {}: {}", connection.fd.fd(), connection.peerAddress, ex.what());
    }
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _activeFds.erase(connection.fd.fd());
    }
    log::debug("Connection fd # {} from {} closed", connection.fd.fd(), connection.peerAddress);
  }
}

void ThreadPoolServer::serveConnection(const PendingConnection& connection) {
  std::string buffer;
  while (!isStopRequested() && serveExchange(connection, buffer)) {
  }
}

bool ThreadPoolServer::serveExchange(const PendingConnection& connection, std::string& buffer) {
  const int fd = connection.fd.fd();

  std::size_t terminator = buffer.find(http::DoubleCRLF);
  while (terminator == std::string::npos) {
    if (buffer.size() > _config.maxHeaderBytes) {
      log::warn("fd # {} header block exceeds {} bytes without terminator", fd, _config.maxHeaderBytes);
      return false;
    }
    const std::size_t oldSize = buffer.size();
    buffer.resize(oldSize + _config.readChunkBytes);
    const auto nbRead = SafeRecv(fd, buffer.data() + oldSize, _config.readChunkBytes);
    if (nbRead <= 0) {
      if (nbRead < 0) {
        log::debug("recv failed on fd # {}: {}", fd, std::strerror(errno));
      }
      return false;
    }
    buffer.resize(oldSize + static_cast<std::size_t>(nbRead));
    // The terminator may straddle the previous chunk.
    terminator = buffer.find(http::DoubleCRLF, oldSize < 3U ? 0 : oldSize - 3U);
  }
  const std::size_t headerEnd = terminator + http::DoubleCRLF.size();
  if (headerEnd > _config.maxHeaderBytes) {
    log::warn("fd # {} header block of {} bytes exceeds limit {}", fd, headerEnd, _config.maxHeaderBytes);
    return false;
  }

  RequestArena arena;
  const auto head = ParseRequestHead(std::string_view(buffer).substr(0, headerEnd), arena.resource());
  if (!head) {
    log::warn("fd # {} sent an unparseable request head, closing", fd);
    return false;
  }
  if (head->contentLength > _config.maxBodyBytes) {
    log::warn("fd # {} Content-Length {} exceeds limit {}", fd, head->contentLength, _config.maxBodyBytes);
    return false;
  }

  SocketBodySource socketBody(fd, std::string_view(buffer).substr(headerEnd), head->contentLength);
  BufferedBodySource emptyBody;
  BodySource& bodySource = http::MethodCarriesBody(head->method) ? static_cast<BodySource&>(socketBody) : emptyBody;

  HttpRequest req(*head, BodyReader(bodySource), connection.peerAddress, arena);
  HttpResponse resp;
  ProcessExchange(*_dispatcher, req, resp);

  const bool keepAlive = _config.enableKeepAlive && head->wantsKeepAlive() && !isStopRequested();
  if (!keepAlive) {
    resp.header(http::Connection, http::close);
  }
  if (!SendAll(fd, resp.serialize(head->method != http::Method::HEAD))) {
    log::debug("send failed on fd # {}: {}", fd, std::strerror(errno));
    return false;
  }
  if (!keepAlive || !socketBody.drain()) {
    return false;
  }
  buffer.erase(0, headerEnd + socketBody.prefetchedConsumed());
  return true;
}

}  // namespace trellis

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include "trellis/connection-state.hpp"
#include "trellis/connection-table.hpp"
#include "trellis/event-loop.hpp"
#include "trellis/event.hpp"
#include "trellis/request-dispatcher.hpp"
#include "trellis/server-config.hpp"
#include "trellis/socket.hpp"

namespace trellis {

// Event-driven HTTP/1.1 server: config.nbWorkers threads poll one shared epoll instance and service whichever
// connections become ready, using non-blocking sockets and a per-connection framing state machine.
//
// Client sockets are registered edge-triggered and one-shot: a readiness event disables the fd until the
// worker handling it re-arms it for reading or writing, so a connection is serviced by a single worker at a time
// and requests on one connection are processed in arrival order.
class EventServer {
 public:
  // Binds and listens immediately on 127.0.0.1:config.port.
  // Throws std::system_error on failure.
  EventServer(const ServerConfig& config, RequestDispatcher& dispatcher);

  EventServer(const EventServer&) = delete;
  EventServer(EventServer&&) = delete;
  EventServer& operator=(const EventServer&) = delete;
  EventServer& operator=(EventServer&&) = delete;

  ~EventServer() = default;

  // Effective bound port.
  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  // Runs the workers until stop() is called or SIGINT / SIGTERM is received (with SignalHandler enabled).
  // The calling thread is one of the workers.
  void run();

  // Requests termination. Workers notice it within one poll interval. Thread-safe.
  void stop() noexcept { _stopRequested.store(true, std::memory_order_relaxed); }

  [[nodiscard]] std::size_t nbConnections() const { return _connections.size(); }

 private:
  static constexpr EventBmp kConnectionEvents = EventRdHup | EventEt | EventOneShot;

  void workerLoop(uint32_t workerId);

  void acceptNewConnections();

  void handleConnectionEvent(int fd, EventBmp events, std::string& readBuffer);

  void handleReadable(ConnectionState& state, std::string& readBuffer);

  void handleWritable(ConnectionState& state);

  void finishExchange(ConnectionState& state);

  void onRequestFramed(ConnectionState& state);

  // Builds the request from the framed bytes, runs it and queues the serialized response.
  // Returns false if the request head cannot be parsed.
  [[nodiscard]] bool processRequest(ConnectionState& state);

  void rearm(int fd, EventBmp interest);

  void closeConnection(int fd);

  [[nodiscard]] FramingLimits limits() const noexcept { return {_config.maxHeaderBytes, _config.maxBodyBytes}; }

  ServerConfig _config;
  RequestDispatcher* _dispatcher;
  Socket _listenSocket;
  EventLoop _eventLoop;
  ConnectionTable _connections;
  std::atomic_bool _stopRequested{false};
  uint16_t _port;
};

}  // namespace trellis

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>

#include "trellis/base-fd.hpp"
#include "trellis/event-loop.hpp"
#include "trellis/request-dispatcher.hpp"
#include "trellis/server-config.hpp"
#include "trellis/socket.hpp"

namespace trellis {

// Blocking HTTP/1.1 server: the accepting thread hands each connection to one of config.nbPoolThreads pooled
// threads, which serves it start to finish with blocking reads and writes (keep-alive included).
// While all pooled threads are busy, accepted connections wait in a FIFO queue.
class ThreadPoolServer {
 public:
  // Binds and listens immediately on 127.0.0.1:config.port.
  // Throws std::system_error on failure.
  ThreadPoolServer(const ServerConfig& config, RequestDispatcher& dispatcher);

  ThreadPoolServer(const ThreadPoolServer&) = delete;
  ThreadPoolServer(ThreadPoolServer&&) = delete;
  ThreadPoolServer& operator=(const ThreadPoolServer&) = delete;
  ThreadPoolServer& operator=(ThreadPoolServer&&) = delete;

  ~ThreadPoolServer() = default;

  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  // Accepts connections on the calling thread until stop() is called or a termination signal is received,
  // then joins the pool.
  void run();

  // Requests termination and shuts down the connections being served so that blocked reads return.
  // Thread-safe.
  void stop() noexcept;

 private:
  struct PendingConnection {
    BaseFd fd;
    std::string peerAddress;
  };

  void acceptNewConnections();

  void poolThreadLoop();

  void serveConnection(const PendingConnection& connection);

  // Serves one request / response exchange. 'buffer' holds bytes read ahead on this connection and keeps those
  // of the next pipelined request. Returns true if the connection should stay open.
  bool serveExchange(const PendingConnection& connection, std::string& buffer);

  [[nodiscard]] bool isStopRequested() const noexcept { return _stopRequested.load(std::memory_order_relaxed); }

  ServerConfig _config;
  RequestDispatcher* _dispatcher;
  Socket _listenSocket;
  // Only watches the listening socket, to bound the accept wait by the poll interval.
  EventLoop _eventLoop;
  std::mutex _mutex;
  std::condition_variable _cv;
  std::deque<PendingConnection> _pending;
  std::unordered_set<int> _activeFds;
  std::atomic_bool _stopRequested{false};
  uint16_t _port;
};

}  // namespace trellis

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace trellis {

enum class ServerMode : std::uint8_t {
  // A fixed set of worker threads sharing one epoll instance, non-blocking sockets and per-connection
  // framing state machines.
  EventDriven,
  // Blocking sockets, each accepted connection served start-to-finish by one pooled thread.
  ThreadPool
};

std::string_view ServerModeToStr(ServerMode mode) noexcept;

struct ServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind on 127.0.0.1. 0 (default) lets the OS pick an ephemeral free port, readable afterwards
  // through App::port().
  uint16_t port{0};

  // If true, enables SO_REUSEPORT. SO_REUSEADDR is always set. Disabled by default.
  bool reusePort{false};

  // If true, disables the Nagle algorithm on accepted sockets. Default: false.
  bool tcpNoDelay{false};

  // ============================
  // Execution model
  // ============================
  ServerMode mode{ServerMode::EventDriven};

  // Number of threads polling the shared epoll instance in event-driven mode. Default: 4.
  uint32_t nbWorkers{4};

  // Number of pooled connection threads in thread-pool mode. Once all are busy, new connections
  // wait in the accept backlog. Default: 4.
  uint32_t nbPoolThreads{4};

  // ===========================================
  // Keep-Alive
  // ===========================================
  // Whether persistent connections are honored. When false, the server always closes after each response
  // regardless of client headers. Default: true.
  bool enableKeepAlive{true};

  // ============================
  // Request framing limits
  // ============================
  // Maximum size in bytes of the request head (request line + headers + CRLFCRLF). A connection exceeding it
  // before the terminator is seen is closed without response. Default: 8 KiB.
  std::size_t maxHeaderBytes{8192};

  // Maximum Content-Length accepted. A larger declared length closes the connection without response.
  // Default: 10 MiB.
  std::size_t maxBodyBytes{10UL * 1024UL * 1024UL};

  // ===========================================
  // Polling / I/O tuning
  // ===========================================
  // Maximum duration a worker blocks in epoll_wait() before checking for stop requests. Default: 100 ms.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{100}};

  // Initial number of event slots of each worker's epoll buffer (grows on saturation). Default: 64.
  uint32_t maxEventsPerPoll{64};

  // Size of each socket read. Default: 4 KiB.
  std::size_t readChunkBytes{4096};

  ServerConfig& withPort(uint16_t port);

  ServerConfig& withReusePort(bool on = true);

  ServerConfig& withTcpNoDelay(bool on = true);

  ServerConfig& withMode(ServerMode mode);

  ServerConfig& withNbWorkers(uint32_t nbWorkers);

  ServerConfig& withNbPoolThreads(uint32_t nbPoolThreads);

  ServerConfig& withKeepAliveMode(bool on = true);

  ServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  ServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  ServerConfig& withPollInterval(std::chrono::milliseconds pollInterval);

  ServerConfig& withMaxEventsPerPoll(uint32_t maxEventsPerPoll);

  ServerConfig& withReadChunkBytes(std::size_t readChunkBytes);

  // Throws std::invalid_argument for unusable values.
  void validate() const;
};

}  // namespace trellis

#include "trellis/server-config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace trellis {

std::string_view ServerModeToStr(ServerMode mode) noexcept {
  switch (mode) {
    case ServerMode::EventDriven:
      return "event-driven";
    case ServerMode::ThreadPool:
      return "thread-pool";
    default:
      return "unknown";
  }
}

ServerConfig& ServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

ServerConfig& ServerConfig::withReusePort(bool on) {
  this->reusePort = on;
  return *this;
}

ServerConfig& ServerConfig::withTcpNoDelay(bool on) {
  this->tcpNoDelay = on;
  return *this;
}

ServerConfig& ServerConfig::withMode(ServerMode mode) {
  this->mode = mode;
  return *this;
}

ServerConfig& ServerConfig::withNbWorkers(uint32_t nbWorkers) {
  this->nbWorkers = nbWorkers;
  return *this;
}

ServerConfig& ServerConfig::withNbPoolThreads(uint32_t nbPoolThreads) {
  this->nbPoolThreads = nbPoolThreads;
  return *this;
}

ServerConfig& ServerConfig::withKeepAliveMode(bool on) {
  this->enableKeepAlive = on;
  return *this;
}

ServerConfig& ServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

ServerConfig& ServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

ServerConfig& ServerConfig::withPollInterval(std::chrono::milliseconds pollInterval) {
  this->pollInterval = pollInterval;
  return *this;
}

ServerConfig& ServerConfig::withMaxEventsPerPoll(uint32_t maxEventsPerPoll) {
  this->maxEventsPerPoll = maxEventsPerPoll;
  return *this;
}

ServerConfig& ServerConfig::withReadChunkBytes(std::size_t readChunkBytes) {
  this->readChunkBytes = readChunkBytes;
  return *this;
}

void ServerConfig::validate() const {
  if (nbWorkers == 0) {
    throw std::invalid_argument("nbWorkers must be > 0");
  }
  if (nbPoolThreads == 0) {
    throw std::invalid_argument("nbPoolThreads must be > 0");
  }
  if (maxHeaderBytes == 0) {
    throw std::invalid_argument("maxHeaderBytes must be > 0");
  }
  if (readChunkBytes == 0) {
    throw std::invalid_argument("readChunkBytes must be > 0");
  }
  if (pollInterval.count() <= 0 || std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("pollInterval must be positive and fit in an int of milliseconds");
  }
}

}  // namespace trellis

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "trellis/connection-state.hpp"

namespace trellis {

// Connection states of the event-driven server, shared by all workers and keyed by fd.
//
// The mutex only protects table membership: it is held for insert / find / erase, never across I/O.
// Exclusive access to a ConnectionState between those boundaries is given by the one-shot epoll registration:
// a connection is reported to exactly one worker until that worker re-arms it, and only that worker may erase it.
class ConnectionTable {
 public:
  ConnectionTable() = default;

  ConnectionTable(const ConnectionTable&) = delete;
  ConnectionTable(ConnectionTable&&) = delete;
  ConnectionTable& operator=(const ConnectionTable&) = delete;
  ConnectionTable& operator=(ConnectionTable&&) = delete;

  ~ConnectionTable() = default;

  // Takes ownership of the state. Returns a stable pointer to it.
  ConnectionState* insert(std::unique_ptr<ConnectionState> state);

  // Returns nullptr if fd is not registered.
  [[nodiscard]] ConnectionState* find(int fd) const;

  // Removes and returns the state so that it is destroyed (and its fd closed) outside of the lock.
  std::unique_ptr<ConnectionState> erase(int fd);

  // Removes all states.
  void clear();

  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex _mutex;
  std::unordered_map<int, std::unique_ptr<ConnectionState>> _states;
};

}  // namespace trellis

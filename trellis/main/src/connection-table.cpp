#include "trellis/connection-table.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "trellis/connection-state.hpp"

namespace trellis {

ConnectionState* ConnectionTable::insert(std::unique_ptr<ConnectionState> state) {
  ConnectionState* ret = state.get();
  const int fd = state->fd.fd();
  std::scoped_lock lock(_mutex);
  // States are erased before their fd is closed, so a fd number cannot be registered twice.
  _states.insert_or_assign(fd, std::move(state));
  return ret;
}

ConnectionState* ConnectionTable::find(int fd) const {
  std::scoped_lock lock(_mutex);
  auto it = _states.find(fd);
  return it == _states.end() ? nullptr : it->second.get();
}

std::unique_ptr<ConnectionState> ConnectionTable::erase(int fd) {
  std::unique_ptr<ConnectionState> ret;
  std::scoped_lock lock(_mutex);
  auto it = _states.find(fd);
  if (it != _states.end()) {
    ret = std::move(it->second);
    _states.erase(it);
  }
  return ret;
}

void ConnectionTable::clear() {
  std::unordered_map<int, std::unique_ptr<ConnectionState>> states;
  {
    std::scoped_lock lock(_mutex);
    states.swap(_states);
  }
}

std::size_t ConnectionTable::size() const {
  std::scoped_lock lock(_mutex);
  return _states.size();
}

}  // namespace trellis

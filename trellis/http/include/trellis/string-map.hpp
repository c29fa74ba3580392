#pragma once

#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trellis {

// Small insertion-ordered string to string map allocating from a memory resource (typically a RequestArena).
// Keys are unique: setting an existing key replaces its value. Lookups are linear, which is faster than hashing
// for the handful of entries a query string or a route typically carries.
class StringMap {
 public:
  using value_type = std::pair<std::pmr::string, std::pmr::string>;
  using const_iterator = std::pmr::vector<value_type>::const_iterator;

  explicit StringMap(std::pmr::memory_resource* mr = std::pmr::get_default_resource()) : _entries(mr) {}

  void set(std::string_view key, std::string_view value) {
    auto it = std::ranges::find_if(_entries, [key](const value_type& entry) { return entry.first == key; });
    if (it == _entries.end()) {
      _entries.emplace_back(key, value);
    } else {
      it->second.assign(value);
    }
  }

  [[nodiscard]] std::optional<std::string_view> find(std::string_view key) const noexcept {
    auto it = std::ranges::find_if(_entries, [key](const value_type& entry) { return entry.first == key; });
    if (it == _entries.end()) {
      return std::nullopt;
    }
    return std::string_view(it->second);
  }

  [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key).has_value(); }

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _entries.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _entries.end(); }

 private:
  std::pmr::vector<value_type> _entries;
};

}  // namespace trellis

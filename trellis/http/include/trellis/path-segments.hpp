#pragma once

#include <cstddef>
#include <string_view>

namespace trellis {

// Iterates over the '/' separated segments of a path, skipping empty ones so that leading, trailing
// and repeated slashes collapse ("/a//b/" yields "a" then "b"; "/" yields nothing).
class PathSegments {
 public:
  explicit PathSegments(std::string_view path) noexcept : _rest(path) {}

  // Stores the next segment into 'segment'. Returns false when there are no more segments.
  bool next(std::string_view& segment) noexcept {
    while (!_rest.empty()) {
      const auto slash = _rest.find('/');
      segment = _rest.substr(0, slash);
      _rest.remove_prefix(slash == std::string_view::npos ? _rest.size() : slash + 1);
      if (!segment.empty()) {
        return true;
      }
    }
    return false;
  }

 private:
  std::string_view _rest;
};

}  // namespace trellis

#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <string>

namespace trellis {

/// Serializes a C++ object to a compact JSON string using glaze.
/// T must be a type glaze can write: an aggregate, a standard container or map, or a type with a glz::meta.
/// Example usage:
///   struct Message { std::string text; };
///   auto json = trellis::SerializeToJson(Message{"hi"});
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

}  // namespace trellis

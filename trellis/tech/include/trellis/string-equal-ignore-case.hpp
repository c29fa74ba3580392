#pragma once

#include <cstddef>
#include <string_view>

namespace trellis {

constexpr char tolower(char ch) noexcept {
  if (ch >= 'A' && ch <= 'Z') {
    ch = static_cast<char>(ch | 0x20);
  }
  return ch;
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

// Returns the position of the first case-insensitive occurrence of needle in haystack, or npos.
constexpr std::size_t CaseInsensitiveFind(std::string_view haystack, std::string_view needle) noexcept {
  if (needle.size() > haystack.size()) {
    return std::string_view::npos;
  }
  for (std::size_t pos = 0; pos + needle.size() <= haystack.size(); ++pos) {
    if (CaseInsensitiveEqual(haystack.substr(pos, needle.size()), needle)) {
      return pos;
    }
  }
  return std::string_view::npos;
}

}  // namespace trellis

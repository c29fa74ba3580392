#pragma once

#include <memory_resource>
#include <string_view>

#include "trellis/string-map.hpp"

namespace trellis {

// Parses an application/x-www-form-urlencoded query string (without the leading '?').
// Pairs are separated by '&' and split on their first '='. Keys and values are percent-decoded
// independently ('+' is decoded as a space in values only). Malformed pairs (no '=', or invalid
// percent encoding) are skipped. When a key repeats, the last value wins.
StringMap ParseQueryString(std::string_view query, std::pmr::memory_resource* mr);

}  // namespace trellis

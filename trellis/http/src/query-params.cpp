#include "trellis/query-params.hpp"

#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>

#include "trellis/string-map.hpp"
#include "trellis/url-decode.hpp"

namespace trellis {

namespace {

// Decodes 'encoded' into 'out'. Returns false on invalid percent encoding.
bool Decode(std::string_view encoded, char plusAs, std::pmr::string& out) {
  out.assign(encoded);
  char* newEnd = url::DecodeInPlace(out.data(), out.data() + out.size(), plusAs);
  if (newEnd == nullptr) {
    return false;
  }
  out.resize(static_cast<std::size_t>(newEnd - out.data()));
  return true;
}

}  // namespace

StringMap ParseQueryString(std::string_view query, std::pmr::memory_resource* mr) {
  StringMap params(mr);
  std::pmr::string key(mr);
  std::pmr::string value(mr);
  while (!query.empty()) {
    const auto pairEnd = query.find('&');
    std::string_view pair = query.substr(0, pairEnd);
    query.remove_prefix(pairEnd == std::string_view::npos ? query.size() : pairEnd + 1);

    const auto eq = pair.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    if (!Decode(pair.substr(0, eq), '+', key) || !Decode(pair.substr(eq + 1), ' ', value)) {
      continue;
    }
    params.set(key, value);
  }
  return params;
}

}  // namespace trellis

#include "trellis/body-reader.hpp"

#include <algorithm>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>

namespace trellis {

std::size_t BufferedBodySource::read(std::span<char> out) {
  const std::size_t nbBytes = std::min(out.size(), _data.size());
  std::copy_n(_data.data(), nbBytes, out.data());
  _data.remove_prefix(nbBytes);
  return nbBytes;
}

std::string BodyReader::readAll(std::size_t maxBytes) {
  if (_source->remaining() > maxBytes) {
    throw std::length_error("request body exceeds the allowed size");
  }
  std::string body(_source->remaining(), '\0');
  std::size_t pos = 0;
  while (pos < body.size()) {
    const std::size_t nbRead = _source->read(std::span<char>(body.data() + pos, body.size() - pos));
    if (nbRead == 0) {
      break;
    }
    pos += nbRead;
  }
  body.resize(pos);
  return body;
}

}  // namespace trellis

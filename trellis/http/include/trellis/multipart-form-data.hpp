#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "trellis/body-reader.hpp"

namespace trellis {

class MultipartError : public std::runtime_error {
 public:
  enum class Kind : uint8_t { MissingBoundary, MalformedPart, MissingPartName, PartTooLarge };

  MultipartError(Kind kind, const char* what) : std::runtime_error(what), _kind(kind) {}

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

 private:
  Kind _kind;
};

// Returns the boundary parameter of a 'multipart/form-data' Content-Type value, quotes removed.
// Returns std::nullopt for another media type or a missing / empty boundary.
std::optional<std::string_view> ExtractBoundary(std::string_view contentType);

// Headers of one part. Values are owned since the underlying buffer keeps moving while streaming.
struct MultipartPartHeaders {
  std::string name;
  std::optional<std::string> filename;
  std::optional<std::string> contentType;
};

// Lazy multipart/form-data parser pulling from a BodyReader, so that arbitrarily large uploads are never fully
// buffered in memory. Usage:
//
//   MultipartReader reader(req.body(), boundary);
//   while (auto part = reader.nextPart()) {
//     reader.streamPartContent([&](std::string_view chunk) { ... }, maxBytes);
//   }
//
// Content not consumed before the next nextPart() call is skipped.
class MultipartReader {
 public:
  using Writer = std::function<void(std::string_view)>;

  static constexpr std::size_t kReadChunkSize = 8192;
  static constexpr std::size_t kMaxPartHeaderBytes = 8192;

  MultipartReader(BodyReader& body, std::string_view boundary);

  // Moves to the next part and returns its headers, or std::nullopt after the closing delimiter.
  // Throws MultipartError (MalformedPart, MissingPartName).
  std::optional<MultipartPartHeaders> nextPart();

  // Streams the current part's content to writer in chunks. Returns the number of content bytes.
  // Throws MultipartError(PartTooLarge) as soon as more than maxBytes are seen, MalformedPart if the body ends
  // before the part's delimiter.
  std::size_t streamPartContent(const Writer& writer, std::size_t maxBytes);

  // Convenience for small fields: collects the current part's content.
  std::string readPartContent(std::size_t maxBytes);

 private:
  // Reads more body bytes into the buffer. Returns false at end of body.
  bool fill();

  // Ensures at least n bytes are buffered. Returns false if the body ends first.
  bool ensure(std::size_t n);

  void skipPreamble();

  BodyReader* _body;
  std::string _delimiter;  // "\r\n--" + boundary
  std::string _buffer;
  std::size_t _pos{0};
  bool _started{false};
  bool _inPart{false};
  bool _finished{false};
};

}  // namespace trellis

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "trellis/base-fd.hpp"

namespace trellis {

// Size ceilings applied while framing a request.
struct FramingLimits {
  std::size_t maxHeaderBytes;
  std::size_t maxBodyBytes;
};

// Per-connection state of the event-driven server.
//
// Framing is an explicit state machine fed with byte chunks of arbitrary size:
//   ReadingHeaders -> (ReadingBody) -> ReadyToProcess
// ReadingBody is skipped when the header block carries no Content-Length (chunked bodies are not supported:
// such requests are framed as bodyless). ReadyToProcess is terminal for the read side of one exchange: bytes
// received afterwards are buffered for the next exchange but do not trigger processing again.
struct ConnectionState {
  enum class Phase : std::uint8_t { ReadingHeaders, ReadingBody, ReadyToProcess };

  enum class FeedResult : std::uint8_t {
    NeedMore,  // wait for more bytes
    Ready,     // a complete request is buffered, process it now
    Abort      // framing limit exceeded or invalid Content-Length: close without responding
  };

  ConnectionState() noexcept = default;

  ConnectionState(BaseFd fd, std::string peerAddress) noexcept
      : fd(std::move(fd)), peerAddress(std::move(peerAddress)) {}

  // Appends bytes to the read buffer and advances framing.
  FeedResult feed(std::string_view bytes, FramingLimits limits);

  // Advances framing over the bytes already buffered.
  FeedResult advance(FramingLimits limits);

  // Header block of the current exchange, final empty line included. Valid once past ReadingHeaders.
  [[nodiscard]] std::string_view headerBlock() const noexcept { return {inBuffer.data(), headerEnd}; }

  // Body of the current exchange. Complete only in ReadyToProcess.
  [[nodiscard]] std::string_view body() const noexcept;

  // Queues serialized response bytes for writing.
  void queueOutput(std::string bytes) {
    outBuffer = std::move(bytes);
    outOffset = 0;
  }

  [[nodiscard]] std::string_view pendingOutput() const noexcept {
    return std::string_view(outBuffer).substr(outOffset);
  }

  // Marks n bytes of the pending output as written.
  void consumeOutput(std::size_t n) noexcept { outOffset += n; }

  [[nodiscard]] bool hasPendingOutput() const noexcept { return outOffset < outBuffer.size(); }

  // Drops the bytes of the finished exchange and goes back to ReadingHeaders.
  // Bytes already received for a following pipelined request are kept; call advance() to frame them.
  void resetForNextExchange() noexcept;

  BaseFd fd;
  std::string peerAddress;
  std::string inBuffer;
  std::string outBuffer;
  std::size_t outOffset{0};
  std::size_t headerEnd{0};
  std::size_t expectedBodyLength{0};
  Phase phase{Phase::ReadingHeaders};
  bool keepAlive{true};
};

}  // namespace trellis

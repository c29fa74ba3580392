#pragma once

#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <string_view>

namespace trellis {

// Producer of request body bytes, bounded by the declared Content-Length.
class BodySource {
 public:
  BodySource() noexcept = default;

  BodySource(const BodySource&) = delete;
  BodySource(BodySource&&) noexcept = delete;
  BodySource& operator=(const BodySource&) = delete;
  BodySource& operator=(BodySource&&) noexcept = delete;

  virtual ~BodySource() = default;

  // Copies up to out.size() bytes into out. Returns 0 once the body is exhausted.
  // May throw std::system_error on I/O failure.
  virtual std::size_t read(std::span<char> out) = 0;

  // Number of body bytes not yet consumed.
  [[nodiscard]] virtual std::size_t remaining() const noexcept = 0;
};

// Body already fully present in memory (event-driven framing accumulates it before processing).
class BufferedBodySource final : public BodySource {
 public:
  explicit BufferedBodySource(std::string_view data = {}) noexcept : _data(data) {}

  std::size_t read(std::span<char> out) override;

  [[nodiscard]] std::size_t remaining() const noexcept override { return _data.size(); }

 private:
  std::string_view _data;
};

// Streaming accessor over a request body. The body is never materialized unless readAll() is called.
class BodyReader {
 public:
  explicit BodyReader(BodySource& source) noexcept : _source(&source) {}

  // Reads up to out.size() bytes. Returns 0 at end of body.
  std::size_t read(std::span<char> out) { return _source->read(out); }

  // Reads the whole remaining body.
  // Throws std::length_error if more than maxBytes remain.
  std::string readAll(std::size_t maxBytes = std::numeric_limits<std::size_t>::max());

  [[nodiscard]] std::size_t remaining() const noexcept { return _source->remaining(); }

 private:
  BodySource* _source;
};

}  // namespace trellis

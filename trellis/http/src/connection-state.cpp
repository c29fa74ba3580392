#include "trellis/connection-state.hpp"

#include <algorithm>
#include <cstddef>
#include <string_view>

#include "trellis/http-constants.hpp"
#include "trellis/log.hpp"
#include "trellis/request-head.hpp"

namespace trellis {

ConnectionState::FeedResult ConnectionState::feed(std::string_view bytes, FramingLimits limits) {
  inBuffer.append(bytes);
  if (phase == Phase::ReadyToProcess) {
    return FeedResult::NeedMore;
  }
  return advance(limits);
}

ConnectionState::FeedResult ConnectionState::advance(FramingLimits limits) {
  if (phase == Phase::ReadingHeaders) {
    const auto terminator = inBuffer.find(http::DoubleCRLF);
    if (terminator == std::string::npos) {
      if (inBuffer.size() > limits.maxHeaderBytes) {
        log::warn("fd # {} header block exceeds {} bytes without terminator", fd.fd(), limits.maxHeaderBytes);
        return FeedResult::Abort;
      }
      return FeedResult::NeedMore;
    }
    headerEnd = terminator + http::DoubleCRLF.size();
    if (headerEnd > limits.maxHeaderBytes) {
      log::warn("fd # {} header block of {} bytes exceeds limit {}", fd.fd(), headerEnd, limits.maxHeaderBytes);
      return FeedResult::Abort;
    }
    const ContentLengthScan scan = ScanContentLength(headerBlock());
    switch (scan.status) {
      case ContentLengthScan::Status::Invalid:
        log::warn("fd # {} invalid Content-Length", fd.fd());
        return FeedResult::Abort;
      case ContentLengthScan::Status::Absent:
        expectedBodyLength = 0;
        phase = Phase::ReadyToProcess;
        return FeedResult::Ready;
      case ContentLengthScan::Status::Present:
        if (scan.value > limits.maxBodyBytes) {
          log::warn("fd # {} Content-Length {} exceeds limit {}", fd.fd(), scan.value, limits.maxBodyBytes);
          return FeedResult::Abort;
        }
        expectedBodyLength = scan.value;
        phase = Phase::ReadingBody;
        break;
    }
  }
  if (phase == Phase::ReadingBody) {
    if (inBuffer.size() - headerEnd < expectedBodyLength) {
      return FeedResult::NeedMore;
    }
    phase = Phase::ReadyToProcess;
    return FeedResult::Ready;
  }
  return FeedResult::NeedMore;
}

std::string_view ConnectionState::body() const noexcept {
  const std::size_t available = inBuffer.size() - headerEnd;
  return std::string_view(inBuffer).substr(headerEnd, std::min(available, expectedBodyLength));
}

void ConnectionState::resetForNextExchange() noexcept {
  const std::size_t consumed = std::min(inBuffer.size(), headerEnd + expectedBodyLength);
  inBuffer.erase(0, consumed);
  outBuffer.clear();
  outOffset = 0;
  headerEnd = 0;
  expectedBodyLength = 0;
  phase = Phase::ReadingHeaders;
}

}  // namespace trellis

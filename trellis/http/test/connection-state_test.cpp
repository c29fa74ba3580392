#include "trellis/connection-state.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace trellis {

namespace {

constexpr FramingLimits kLimits{64, 32};

using FeedResult = ConnectionState::FeedResult;
using Phase = ConnectionState::Phase;

}  // namespace

class ConnectionStateTest : public ::testing::Test {
 protected:
  ConnectionState state;
};

TEST_F(ConnectionStateTest, BodylessRequestReadyAfterHeaders) {
  EXPECT_EQ(state.feed("GET / HTTP/1.1\r\n", kLimits), FeedResult::NeedMore);
  EXPECT_EQ(state.phase, Phase::ReadingHeaders);
  EXPECT_EQ(state.feed("\r\n", kLimits), FeedResult::Ready);
  EXPECT_EQ(state.phase, Phase::ReadyToProcess);
  EXPECT_EQ(state.headerBlock(), "GET / HTTP/1.1\r\n\r\n");
  EXPECT_EQ(state.body(), "");
}

TEST_F(ConnectionStateTest, BodyFramedByContentLength) {
  EXPECT_EQ(state.feed("POST / HTTP/1.1\r\nContent-Length: 5\r\n\r\nhe", kLimits), FeedResult::NeedMore);
  EXPECT_EQ(state.phase, Phase::ReadingBody);
  EXPECT_EQ(state.expectedBodyLength, 5U);
  EXPECT_EQ(state.feed("llo", kLimits), FeedResult::Ready);
  EXPECT_EQ(state.body(), "hello");
}

TEST_F(ConnectionStateTest, ByteByByteFeeding) {
  const std::string_view raw = "POST /x HTTP/1.1\r\nContent-Length: 3\r\n\r\nabc";
  for (std::size_t pos = 0; pos + 1 < raw.size(); ++pos) {
    ASSERT_EQ(state.feed(raw.substr(pos, 1), kLimits), FeedResult::NeedMore) << "at byte " << pos;
  }
  EXPECT_EQ(state.feed(raw.substr(raw.size() - 1), kLimits), FeedResult::Ready);
  EXPECT_EQ(state.body(), "abc");
}

TEST_F(ConnectionStateTest, ReadyReportedExactlyOnce) {
  EXPECT_EQ(state.feed("GET / HTTP/1.1\r\n\r\n", kLimits), FeedResult::Ready);
  // Bytes of a following request are buffered but do not trigger processing again.
  EXPECT_EQ(state.feed("GET /next HTTP/1.1\r\n\r\n", kLimits), FeedResult::NeedMore);
  EXPECT_EQ(state.phase, Phase::ReadyToProcess);
  EXPECT_EQ(state.headerBlock(), "GET / HTTP/1.1\r\n\r\n");
}

TEST_F(ConnectionStateTest, HeaderCeilingWithoutTerminatorAborts) {
  const std::string longLine(kLimits.maxHeaderBytes + 1, 'a');
  EXPECT_EQ(state.feed(longLine, kLimits), FeedResult::Abort);
}

TEST_F(ConnectionStateTest, HeaderBlockLongerThanCeilingAborts) {
  std::string raw = "GET / HTTP/1.1\r\nX-Pad: ";
  raw.append(kLimits.maxHeaderBytes, 'p');
  raw.append("\r\n\r\n");
  EXPECT_EQ(state.feed(raw, kLimits), FeedResult::Abort);
}

TEST_F(ConnectionStateTest, BodyCeilingAbortsBeforeReadingBody) {
  EXPECT_EQ(state.feed("POST / HTTP/1.1\r\nContent-Length: 33\r\n\r\n", kLimits), FeedResult::Abort);
}

TEST_F(ConnectionStateTest, BodyAtCeilingAccepted) {
  std::string raw = "POST / HTTP/1.1\r\nContent-Length: 32\r\n\r\n";
  raw.append(32, 'b');
  EXPECT_EQ(state.feed(raw, kLimits), FeedResult::Ready);
  EXPECT_EQ(state.body().size(), 32U);
}

TEST_F(ConnectionStateTest, InvalidContentLengthAborts) {
  EXPECT_EQ(state.feed("POST / HTTP/1.1\r\nContent-Length: x\r\n\r\n", kLimits), FeedResult::Abort);
}

TEST_F(ConnectionStateTest, PipelinedSurplusKeptForNextExchange) {
  EXPECT_EQ(state.feed("POST /a HTTP/1.1\r\nContent-Length: 2\r\n\r\nokGET /b HTTP/1.1\r\n\r\n", kLimits),
            FeedResult::Ready);
  EXPECT_EQ(state.body(), "ok");

  state.queueOutput("response");
  state.consumeOutput(8);
  EXPECT_FALSE(state.hasPendingOutput());

  state.resetForNextExchange();
  EXPECT_EQ(state.phase, Phase::ReadingHeaders);
  EXPECT_EQ(state.inBuffer, "GET /b HTTP/1.1\r\n\r\n");
  EXPECT_EQ(state.advance(kLimits), FeedResult::Ready);
  EXPECT_EQ(state.headerBlock(), "GET /b HTTP/1.1\r\n\r\n");
}

TEST_F(ConnectionStateTest, PartialOutputTracking) {
  state.queueOutput("abcdef");
  EXPECT_EQ(state.pendingOutput(), "abcdef");
  state.consumeOutput(4);
  EXPECT_TRUE(state.hasPendingOutput());
  EXPECT_EQ(state.pendingOutput(), "ef");
  state.consumeOutput(2);
  EXPECT_FALSE(state.hasPendingOutput());
}

}  // namespace trellis

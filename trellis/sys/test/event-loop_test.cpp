#include "trellis/event-loop.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <array>
#include <chrono>
#include <vector>

#include "trellis/base-fd.hpp"
#include "trellis/event.hpp"

namespace trellis {

namespace {

struct Pipe {
  Pipe() {
    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), O_CLOEXEC | O_NONBLOCK) == 0) {
      readEnd = BaseFd(fds[0]);
      writeEnd = BaseFd(fds[1]);
    }
  }

  BaseFd readEnd;
  BaseFd writeEnd;
};

}  // namespace

TEST(EventLoop, TimeoutYieldsEmptyNonNullSpan) {
  EventLoop loop(std::chrono::milliseconds{1});
  EventLoop::Buffer buffer;
  const auto events = loop.poll(buffer);
  EXPECT_TRUE(events.empty());
  EXPECT_NE(events.data(), nullptr);
}

TEST(EventLoop, ReportsReadablePipe) {
  EventLoop loop(std::chrono::milliseconds{50});
  Pipe pipe;
  ASSERT_TRUE(pipe.readEnd);
  loop.addOrThrow(EventLoop::EventFd{pipe.readEnd.fd(), EventIn});
  ASSERT_EQ(::write(pipe.writeEnd.fd(), "x", 1), 1);

  EventLoop::Buffer buffer;
  const auto events = loop.poll(buffer);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].fd, pipe.readEnd.fd());
  EXPECT_NE(events[0].eventBmp & EventIn, 0U);
}

TEST(EventLoop, OneShotDisablesUntilRearmed) {
  EventLoop loop(std::chrono::milliseconds{10});
  Pipe pipe;
  ASSERT_TRUE(pipe.readEnd);
  loop.addOrThrow(EventLoop::EventFd{pipe.readEnd.fd(), EventIn | EventOneShot});
  ASSERT_EQ(::write(pipe.writeEnd.fd(), "x", 1), 1);

  EventLoop::Buffer buffer;
  EXPECT_EQ(loop.poll(buffer).size(), 1U);
  // Still readable, but the registration is disarmed.
  EXPECT_TRUE(loop.poll(buffer).empty());
  ASSERT_TRUE(loop.mod(EventLoop::EventFd{pipe.readEnd.fd(), EventIn | EventOneShot}));
  EXPECT_EQ(loop.poll(buffer).size(), 1U);
}

TEST(EventLoop, BufferGrowsOnSaturation) {
  EventLoop loop(std::chrono::milliseconds{10});
  std::vector<Pipe> pipes(3);
  for (Pipe& pipe : pipes) {
    ASSERT_TRUE(pipe.readEnd);
    loop.addOrThrow(EventLoop::EventFd{pipe.readEnd.fd(), EventIn});
    ASSERT_EQ(::write(pipe.writeEnd.fd(), "x", 1), 1);
  }
  EventLoop::Buffer buffer(2);
  EXPECT_EQ(buffer.capacity(), 2U);
  EXPECT_EQ(loop.poll(buffer).size(), 2U);
  EXPECT_EQ(buffer.capacity(), 4U);
  EXPECT_EQ(loop.poll(buffer).size(), 3U);
}

TEST(EventLoop, ZeroCapacityPromotedToOne) {
  EventLoop::Buffer buffer(0);
  EXPECT_EQ(buffer.capacity(), 1U);
}

TEST(EventLoop, ModAndDelOnUnknownFd) {
  EventLoop loop(std::chrono::milliseconds{1});
  Pipe pipe;
  ASSERT_TRUE(pipe.readEnd);
  EXPECT_FALSE(loop.mod(EventLoop::EventFd{pipe.readEnd.fd(), EventIn}));
  loop.del(pipe.readEnd.fd());
  EXPECT_TRUE(loop.add(EventLoop::EventFd{pipe.readEnd.fd(), EventIn}));
  EXPECT_FALSE(loop.add(EventLoop::EventFd{pipe.readEnd.fd(), EventIn}));
}

}  // namespace trellis

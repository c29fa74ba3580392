#include "trellis/connection-table.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <memory>

#include "trellis/base-fd.hpp"
#include "trellis/connection-state.hpp"

namespace trellis {

namespace {

std::unique_ptr<ConnectionState> MakeState() {
  int fds[2];
  EXPECT_EQ(::pipe(fds), 0);
  ::close(fds[1]);
  return std::make_unique<ConnectionState>(BaseFd(fds[0]), "127.0.0.1:1234");
}

}  // namespace

TEST(ConnectionTable, InsertFindErase) {
  ConnectionTable table;
  auto state = MakeState();
  const int fd = state->fd.fd();
  ConnectionState* inserted = table.insert(std::move(state));

  EXPECT_EQ(table.size(), 1U);
  EXPECT_EQ(table.find(fd), inserted);
  EXPECT_EQ(table.find(fd + 1000), nullptr);

  auto erased = table.erase(fd);
  ASSERT_NE(erased, nullptr);
  EXPECT_EQ(erased.get(), inserted);
  EXPECT_EQ(erased->peerAddress, "127.0.0.1:1234");
  EXPECT_EQ(table.size(), 0U);
  EXPECT_EQ(table.find(fd), nullptr);
  EXPECT_EQ(table.erase(fd), nullptr);
}

TEST(ConnectionTable, Clear) {
  ConnectionTable table;
  table.insert(MakeState());
  table.insert(MakeState());
  EXPECT_EQ(table.size(), 2U);
  table.clear();
  EXPECT_EQ(table.size(), 0U);
}

}  // namespace trellis

#include "trellis/body-reader.hpp"

#include <gtest/gtest.h>

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

namespace trellis {

TEST(BodyReader, ReadsInChunks) {
  BufferedBodySource source("hello world");
  BodyReader reader(source);
  EXPECT_EQ(reader.remaining(), 11U);

  std::array<char, 4> chunk{};
  std::string collected;
  while (const auto nbRead = reader.read(chunk)) {
    collected.append(chunk.data(), nbRead);
  }
  EXPECT_EQ(collected, "hello world");
  EXPECT_EQ(reader.remaining(), 0U);
  EXPECT_EQ(reader.read(chunk), 0U);
}

TEST(BodyReader, ReadAll) {
  BufferedBodySource source("payload");
  BodyReader reader(source);
  EXPECT_EQ(reader.readAll(), "payload");
  EXPECT_EQ(reader.readAll(), "");
}

TEST(BodyReader, ReadAllAboveLimitThrows) {
  BufferedBodySource source("0123456789");
  BodyReader reader(source);
  EXPECT_THROW(reader.readAll(9), std::length_error);
  EXPECT_EQ(reader.remaining(), 10U);
  EXPECT_EQ(reader.readAll(10), "0123456789");
}

TEST(BodyReader, EmptyBody) {
  BufferedBodySource source;
  BodyReader reader(source);
  EXPECT_EQ(reader.remaining(), 0U);
  EXPECT_EQ(reader.readAll(), "");
}

}  // namespace trellis

#include "trellis/multipart-form-data.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "trellis/body-reader.hpp"

namespace trellis {

namespace {

// Hands out at most 'chunkSize' bytes per read, to exercise delimiters split across reads.
class TricklingBodySource final : public BodySource {
 public:
  TricklingBodySource(std::string_view data, std::size_t chunkSize) : _data(data), _chunkSize(chunkSize) {}

  std::size_t read(std::span<char> out) override {
    const std::size_t nb = std::min({out.size(), _chunkSize, _data.size()});
    std::copy_n(_data.data(), nb, out.data());
    _data.remove_prefix(nb);
    return nb;
  }

  [[nodiscard]] std::size_t remaining() const noexcept override { return _data.size(); }

 private:
  std::string_view _data;
  std::size_t _chunkSize;
};

constexpr std::string_view kBoundary = "XyZ123";

constexpr std::string_view kTwoParts =
    "--XyZ123\r\n"
    "Content-Disposition: form-data; name=\"title\"\r\n"
    "\r\n"
    "hello world\r\n"
    "--XyZ123\r\n"
    "Content-Disposition: form-data; name=\"doc\"; filename=\"notes.txt\"\r\n"
    "Content-Type: text/plain\r\n"
    "\r\n"
    "line1\r\nline2 --XyZ12 almost a delimiter\r\n"
    "--XyZ123--\r\n";

MultipartError::Kind KindOf(auto&& fn) {
  try {
    fn();
  } catch (const MultipartError& ex) {
    return ex.kind();
  }
  ADD_FAILURE() << "expected a MultipartError";
  return MultipartError::Kind::MissingBoundary;
}

}  // namespace

TEST(ExtractBoundary, PlainAndQuoted) {
  EXPECT_EQ(ExtractBoundary("multipart/form-data; boundary=abc"), std::optional<std::string_view>("abc"));
  EXPECT_EQ(ExtractBoundary("Multipart/Form-Data; charset=utf-8; boundary=\"a b\""),
            std::optional<std::string_view>("a b"));
}

TEST(ExtractBoundary, Rejected) {
  EXPECT_FALSE(ExtractBoundary("multipart/form-data"));
  EXPECT_FALSE(ExtractBoundary("multipart/form-data; charset=utf-8"));
  EXPECT_FALSE(ExtractBoundary("multipart/form-data; boundary=\"\""));
  EXPECT_FALSE(ExtractBoundary("application/json; boundary=abc"));
}

class MultipartReaderTest : public ::testing::TestWithParam<std::size_t> {};

TEST_P(MultipartReaderTest, ParsesPartsWhateverTheReadSize) {
  TricklingBodySource source(kTwoParts, GetParam());
  BodyReader body(source);
  MultipartReader reader(body, kBoundary);

  auto first = reader.nextPart();
  ASSERT_TRUE(first);
  EXPECT_EQ(first->name, "title");
  EXPECT_FALSE(first->filename);
  EXPECT_EQ(reader.readPartContent(1024), "hello world");

  auto second = reader.nextPart();
  ASSERT_TRUE(second);
  EXPECT_EQ(second->name, "doc");
  EXPECT_EQ(second->filename, std::optional<std::string>("notes.txt"));
  EXPECT_EQ(second->contentType, std::optional<std::string>("text/plain"));
  std::string content;
  const auto nb = reader.streamPartContent([&](std::string_view chunk) { content.append(chunk); }, 1024);
  EXPECT_EQ(content, "line1\r\nline2 --XyZ12 almost a delimiter");
  EXPECT_EQ(nb, content.size());

  EXPECT_FALSE(reader.nextPart());
  EXPECT_FALSE(reader.nextPart());
}

INSTANTIATE_TEST_SUITE_P(ReadSizes, MultipartReaderTest, ::testing::Values(1U, 3U, 7U, 4096U));

TEST(MultipartReader, UnreadContentIsSkipped) {
  TricklingBodySource source(kTwoParts, 5);
  BodyReader body(source);
  MultipartReader reader(body, kBoundary);
  ASSERT_TRUE(reader.nextPart());
  auto second = reader.nextPart();
  ASSERT_TRUE(second);
  EXPECT_EQ(second->name, "doc");
}

TEST(MultipartReader, PreambleIsIgnored) {
  const std::string data = std::string("this is a preamble\r\n") + std::string(kTwoParts);
  TricklingBodySource source(data, 64);
  BodyReader body(source);
  MultipartReader reader(body, kBoundary);
  auto part = reader.nextPart();
  ASSERT_TRUE(part);
  EXPECT_EQ(part->name, "title");
}

TEST(MultipartReader, PartTooLarge) {
  TricklingBodySource source(kTwoParts, 4);
  BodyReader body(source);
  MultipartReader reader(body, kBoundary);
  ASSERT_TRUE(reader.nextPart());
  EXPECT_EQ(KindOf([&] { reader.readPartContent(5); }), MultipartError::Kind::PartTooLarge);
}

TEST(MultipartReader, ExactSizeIsAccepted) {
  TricklingBodySource source(kTwoParts, 4);
  BodyReader body(source);
  MultipartReader reader(body, kBoundary);
  ASSERT_TRUE(reader.nextPart());
  EXPECT_EQ(reader.readPartContent(11), "hello world");
}

TEST(MultipartReader, MissingName) {
  constexpr std::string_view kData =
      "--XyZ123\r\n"
      "Content-Disposition: form-data; filename=\"a.txt\"\r\n"
      "\r\n"
      "x\r\n"
      "--XyZ123--\r\n";
  TricklingBodySource source(kData, 4096);
  BodyReader body(source);
  MultipartReader reader(body, kBoundary);
  EXPECT_EQ(KindOf([&] { reader.nextPart(); }), MultipartError::Kind::MissingPartName);
}

TEST(MultipartReader, NotFormData) {
  constexpr std::string_view kData =
      "--XyZ123\r\n"
      "Content-Disposition: attachment; name=\"a\"\r\n"
      "\r\n"
      "x\r\n"
      "--XyZ123--\r\n";
  TricklingBodySource source(kData, 4096);
  BodyReader body(source);
  MultipartReader reader(body, kBoundary);
  EXPECT_EQ(KindOf([&] { reader.nextPart(); }), MultipartError::Kind::MalformedPart);
}

TEST(MultipartReader, TruncatedBody) {
  constexpr std::string_view kData =
      "--XyZ123\r\n"
      "Content-Disposition: form-data; name=\"a\"\r\n"
      "\r\n"
      "never terminated";
  TricklingBodySource source(kData, 4096);
  BodyReader body(source);
  MultipartReader reader(body, kBoundary);
  ASSERT_TRUE(reader.nextPart());
  EXPECT_EQ(KindOf([&] { reader.readPartContent(1024); }), MultipartError::Kind::MalformedPart);
}

TEST(MultipartReader, NoOpeningDelimiter) {
  TricklingBodySource source("just some bytes", 4096);
  BodyReader body(source);
  MultipartReader reader(body, kBoundary);
  EXPECT_EQ(KindOf([&] { reader.nextPart(); }), MultipartError::Kind::MalformedPart);
}

}  // namespace trellis

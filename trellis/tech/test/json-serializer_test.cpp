#include "trellis/json-serializer.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct UploadedPart {
  std::string field;
  uint64_t size;
};

template <>
struct glz::meta<UploadedPart> {
  using T = UploadedPart;
  static constexpr auto value = glz::object("field", &T::field, "size", &T::size);
};

namespace trellis {

TEST(JsonSerializer, SerializesObjectWithMeta) {
  EXPECT_EQ(SerializeToJson(UploadedPart{"avatar", 42}), R"({"field":"avatar","size":42})");
}

TEST(JsonSerializer, SerializesContainers) {
  std::vector<UploadedPart> parts{{"a", 1}, {"b", 2}};
  EXPECT_EQ(SerializeToJson(parts), R"([{"field":"a","size":1},{"field":"b","size":2}])");

  std::map<std::string, std::string> obj{{"id", "7"}};
  EXPECT_EQ(SerializeToJson(obj), R"({"id":"7"})");
}

TEST(JsonSerializer, EscapesQuotesAndControlCharacters) {
  std::map<std::string, std::string> obj{{"id", "a\"b\n"}};
  const std::string json = SerializeToJson(obj);
  EXPECT_EQ(json, R"({"id":"a\"b\n"})");

  std::map<std::string, std::string> back;
  const auto ec = glz::read_json(back, json);
  ASSERT_FALSE(static_cast<bool>(ec));
  EXPECT_EQ(back.at("id"), "a\"b\n");
}

}  // namespace trellis

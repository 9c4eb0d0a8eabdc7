#include "pagedstream/json-serializer.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

#include "pagedstream/raw-chars.hpp"

struct TestMessage {
  std::string message;
  std::optional<int> code;

  bool operator==(const TestMessage&) const = default;
};

template <>
struct glz::meta<TestMessage> {
  using T = TestMessage;
  static constexpr auto value = glz::object("message", &T::message, "code", &T::code);
};

namespace pagedstream {

TEST(JsonSerializerTest, SerializeKeepsExplicitNulls) {
  TestMessage msg{"Hello, World!", std::nullopt};
  EXPECT_EQ(SerializeToJson(msg), R"({"message":"Hello, World!","code":null})");
}

TEST(JsonSerializerTest, AppendJsonAppendsAfterExistingBytes) {
  RawChars out;
  out.append(std::string_view("["));
  std::string scratch;
  ASSERT_TRUE(AppendJson(TestMessage{"a", 1}, scratch, out));
  EXPECT_EQ(std::string_view(out), R"([{"message":"a","code":1})");
}

TEST(JsonSerializerTest, DeserializeLenientIgnoresUnknownFields) {
  TestMessage msg;
  std::string error;
  ASSERT_TRUE(DeserializeFromJson(std::string(R"({"message":"hi","extra":true})"), true, msg, error));
  EXPECT_EQ(msg.message, "hi");
}

TEST(JsonSerializerTest, DeserializeStrictRejectsUnknownFields) {
  TestMessage msg;
  std::string error;
  EXPECT_FALSE(DeserializeFromJson(std::string(R"({"message":"hi","extra":true})"), false, msg, error));
  EXPECT_FALSE(error.empty());
}

TEST(JsonSerializerTest, DeserializeRejectsWrongType) {
  TestMessage msg;
  std::string error;
  EXPECT_FALSE(DeserializeFromJson(std::string(R"({"message":42})"), true, msg, error));
}

}  // namespace pagedstream

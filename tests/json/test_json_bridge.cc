#include <gtest/gtest.h>

#include <cstdint>

#include "bodyroute/json/json_bridge.h"

using namespace bodyroute::json;

TEST(JsonBridgeTest, ParseObject) {
  auto value = JsonValue::parse(R"({"method":"echo2","id":7,"ok":true})");
  ASSERT_TRUE(value.isObject());
  EXPECT_EQ(value.size(), 3u);
  EXPECT_EQ(value.at("method").getString(), "echo2");
  EXPECT_EQ(value.at("id").getInt64(), 7);
  EXPECT_TRUE(value.at("ok").getBool());
  EXPECT_FALSE(value.contains("missing"));
}

TEST(JsonBridgeTest, ParseErrorThrowsJsonException) {
  EXPECT_THROW(JsonValue::parse("not json"), JsonException);
  EXPECT_THROW(JsonValue::parse(""), JsonException);
  EXPECT_THROW(JsonValue::parse(R"({"a":)"), JsonException);
}

TEST(JsonBridgeTest, TypeChecks) {
  EXPECT_TRUE(JsonValue().isNull());
  EXPECT_TRUE(JsonValue(true).isBoolean());
  EXPECT_TRUE(JsonValue(3).isInteger());
  EXPECT_TRUE(JsonValue(2.5).isFloat());
  EXPECT_TRUE(JsonValue(2.5).isNumber());
  EXPECT_TRUE(JsonValue("s").isString());
  EXPECT_TRUE(JsonValue::array().isArray());
  EXPECT_TRUE(JsonValue::object().isObject());
  EXPECT_EQ(JsonValue::parse("[1]").type(), JsonType::Array);
}

TEST(JsonBridgeTest, WrongTypeAccessThrows) {
  JsonValue value("text");
  EXPECT_THROW(value.getBool(), JsonException);
  EXPECT_THROW(value.getInt64(), JsonException);
  EXPECT_THROW(value.at("key"), JsonException);
  EXPECT_THROW(JsonValue::object().at("key"), JsonException);
  EXPECT_THROW(JsonValue::array()[0], JsonException);
}

TEST(JsonBridgeTest, UnsignedAccess) {
  auto value = JsonValue::parse(
      R"({"max":18446744073709551615,"small":5,"negative":-5})");
  EXPECT_TRUE(value.at("max").isUnsigned());
  EXPECT_EQ(value.at("max").getUInt64(), UINT64_MAX);
  EXPECT_EQ(value.at("small").getUInt64(), 5u);

  EXPECT_TRUE(value.at("negative").isInteger());
  EXPECT_FALSE(value.at("negative").isUnsigned());
  EXPECT_THROW(value.at("negative").getUInt64(), JsonException);
  EXPECT_THROW(JsonValue("5").getUInt64(), JsonException);

  // Non-negative values built as signed integers count as unsigned
  EXPECT_TRUE(JsonValue(static_cast<int64_t>(7)).isUnsigned());
  EXPECT_EQ(JsonValue(static_cast<int64_t>(7)).getUInt64(), 7u);
  EXPECT_EQ(JsonValue(static_cast<uint64_t>(UINT64_MAX)).getUInt64(),
            UINT64_MAX);
}

TEST(JsonBridgeTest, CopyIsIndependent) {
  JsonValue original = JsonValue::object();
  original.set("a", JsonValue(1));

  JsonValue copy = original;
  copy.set("b", JsonValue(2));

  EXPECT_EQ(original.size(), 1u);
  EXPECT_EQ(copy.size(), 2u);
}

TEST(JsonBridgeTest, MoveAssignment) {
  JsonValue target;
  JsonValue source = JsonValue::parse(R"({"k":"v"})");
  target = std::move(source);
  EXPECT_EQ(target.at("k").getString(), "v");
}

TEST(JsonBridgeTest, Builders) {
  auto value = JsonObjectBuilder()
                   .add("route", "echo2")
                   .add("debug", false)
                   .add("count", 3)
                   .add("rules", JsonArrayBuilder()
                                     .add(JsonValue("a"))
                                     .add(JsonValue("b"))
                                     .build())
                   .build();

  EXPECT_EQ(value.at("route").getString(), "echo2");
  EXPECT_FALSE(value.at("debug").getBool());
  EXPECT_EQ(value.at("count").getInt64(), 3);
  EXPECT_EQ(value.at("rules").size(), 2u);
  EXPECT_EQ(value.at("rules")[1].getString(), "b");

  auto keys = value.keys();
  EXPECT_EQ(keys.size(), 4u);
}

TEST(JsonBridgeTest, ToStringRoundTrip) {
  auto value = JsonValue::parse(R"({"list":[1,2,3],"name":"x"})");
  auto reparsed = JsonValue::parse(value.toString());
  EXPECT_EQ(reparsed.at("list").size(), 3u);
  EXPECT_EQ(reparsed.at("name").getString(), "x");
}

TEST(JsonBridgeTest, ToStringReplacesInvalidUtf8) {
  JsonValue value(std::string("bad\xff"));
  EXPECT_NO_THROW(value.toString());
}

#include <gtest/gtest.h>

#include "bodyroute/filter/payload_extractor.h"

namespace bodyroute {
namespace filter {
namespace {

TEST(PayloadExtractorTest, ExtractsStringField) {
  PayloadExtractor extractor("method");
  auto signal = extractor.extract(R"({"jsonrpc":"2.0","method":"tools/call"})");
  ASSERT_TRUE(signal.has_value());
  EXPECT_EQ("tools/call", *signal);
}

TEST(PayloadExtractorTest, EmptyBody) {
  EXPECT_FALSE(extractField("", "method").has_value());
}

TEST(PayloadExtractorTest, MissingField) {
  EXPECT_FALSE(extractField("{}", "method").has_value());
  EXPECT_FALSE(extractField(R"({"id": 1})", "method").has_value());
}

TEST(PayloadExtractorTest, MalformedJson) {
  EXPECT_FALSE(extractField("not json at all", "method").has_value());
  EXPECT_FALSE(extractField(R"({"method": "x")", "method").has_value());
}

TEST(PayloadExtractorTest, NonObjectDocument) {
  EXPECT_FALSE(extractField(R"(["method"])", "method").has_value());
  EXPECT_FALSE(extractField(R"("method")", "method").has_value());
}

TEST(PayloadExtractorTest, WrongFieldType) {
  EXPECT_FALSE(extractField(R"({"method": 7})", "method").has_value());
  EXPECT_FALSE(extractField(R"({"method": null})", "method").has_value());
  EXPECT_FALSE(
      extractField(R"({"method": {"name": "echo2"}})", "method").has_value());
}

TEST(PayloadExtractorTest, OnlyTopLevelField) {
  EXPECT_FALSE(
      extractField(R"({"params": {"method": "echo2"}})", "method").has_value());
}

TEST(PayloadExtractorTest, InvalidUtf8) {
  std::string body = "{\"method\":\"echo2\xc3\"}";
  EXPECT_FALSE(extractField(body, "method").has_value());
}

TEST(PayloadExtractorTest, ByteOrderMarkYieldsNoSignal) {
  std::string body = "\xEF\xBB\xBF{\"method\":\"invoke_echo2\"}";
  EXPECT_FALSE(extractField(body, "method").has_value());

  // A BOM inside a string value is ordinary text
  auto signal =
      extractField("{\"method\":\"\xEF\xBB\xBF" "echo2\"}", "method");
  ASSERT_TRUE(signal.has_value());
  EXPECT_EQ("\xEF\xBB\xBF" "echo2", *signal);
}

TEST(PayloadExtractorTest, UnicodeValue) {
  auto signal = extractField("{\"method\":\"caf\xc3\xa9\"}", "method");
  ASSERT_TRUE(signal.has_value());
  EXPECT_EQ("caf\xc3\xa9", *signal);
}

TEST(PayloadExtractorTest, EscapedValue) {
  auto signal = extractField(R"({"method":"a\"bA"})", "method");
  ASSERT_TRUE(signal.has_value());
  EXPECT_EQ("a\"bA", *signal);
}

TEST(PayloadExtractorTest, CustomFieldName) {
  PayloadExtractor extractor("service");
  EXPECT_EQ("service", extractor.fieldName());
  auto signal = extractor.extract(R"({"method":"x","service":"billing"})");
  ASSERT_TRUE(signal.has_value());
  EXPECT_EQ("billing", *signal);
}

TEST(Utf8ValidationTest, AcceptsWellFormed) {
  EXPECT_TRUE(isValidUtf8(""));
  EXPECT_TRUE(isValidUtf8("plain ascii"));
  EXPECT_TRUE(isValidUtf8("\xc3\xa9"));          // U+00E9
  EXPECT_TRUE(isValidUtf8("\xe2\x82\xac"));      // U+20AC
  EXPECT_TRUE(isValidUtf8("\xf0\x9f\x98\x80"));  // U+1F600
}

TEST(Utf8ValidationTest, RejectsMalformed) {
  EXPECT_FALSE(isValidUtf8("\x80"));              // Stray continuation
  EXPECT_FALSE(isValidUtf8("\xc3"));              // Truncated
  EXPECT_FALSE(isValidUtf8("\xe2\x82"));          // Truncated
  EXPECT_FALSE(isValidUtf8("\xc0\xaf"));          // Overlong
  EXPECT_FALSE(isValidUtf8("\xed\xa0\x80"));      // Surrogate
  EXPECT_FALSE(isValidUtf8("\xf4\x90\x80\x80"));  // Above U+10FFFF
  EXPECT_FALSE(isValidUtf8("\xff"));
}

}  // namespace
}  // namespace filter
}  // namespace bodyroute

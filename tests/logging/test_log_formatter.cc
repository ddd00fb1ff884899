#include <gtest/gtest.h>

#include "bodyroute/json/json_bridge.h"
#include "bodyroute/logging/log_formatter.h"

using namespace bodyroute::logging;

namespace {

LogMessage makeMessage() {
  LogMessage msg;
  msg.level = LogLevel::Info;
  msg.logger_name = "filter.body_routing";
  msg.component = Component::Filter;
  msg.component_name = "body_routing";
  msg.request_id = "req-9";
  msg.route_id = "echo2";
  msg.bytes_processed = 31;
  msg.message = "Routing decision";
  return msg;
}

}  // namespace

TEST(DefaultFormatterTest, IncludesCorrelationFields) {
  DefaultFormatter formatter;
  auto line = formatter.format(makeMessage());

  EXPECT_NE(line.find("[INFO]"), std::string::npos);
  EXPECT_NE(line.find("[Filter.body_routing]"), std::string::npos);
  EXPECT_NE(line.find("[req:req-9]"), std::string::npos);
  EXPECT_NE(line.find("Routing decision route=echo2 bytes=31"),
            std::string::npos);
}

TEST(DefaultFormatterTest, OmitsEmptyFields) {
  DefaultFormatter formatter;
  LogMessage msg;
  msg.logger_name = "default";
  msg.message = "plain";
  auto line = formatter.format(msg);

  EXPECT_EQ(line.find("req:"), std::string::npos);
  EXPECT_EQ(line.find("route="), std::string::npos);
}

TEST(JsonFormatterTest, ProducesParseableRecord) {
  JsonFormatter formatter;
  auto msg = makeMessage();
  msg.message = "quote \" backslash \\ newline \n tab \t";
  msg.key_values["state"] = "Completed";

  auto record = bodyroute::json::JsonValue::parse(formatter.format(msg));
  EXPECT_EQ(record.at("level").getString(), "INFO");
  EXPECT_EQ(record.at("request_id").getString(), "req-9");
  EXPECT_EQ(record.at("route_id").getString(), "echo2");
  EXPECT_EQ(record.at("bytes_processed").getInt64(), 31);
  EXPECT_EQ(record.at("message").getString(), msg.message);
  EXPECT_EQ(record.at("metadata").at("state").getString(), "Completed");
}

TEST(JsonFormatterTest, EscapesControlCharacters) {
  JsonFormatter formatter;
  LogMessage msg;
  msg.logger_name = "x";
  msg.message = std::string("bell\x07");

  auto record = bodyroute::json::JsonValue::parse(formatter.format(msg));
  EXPECT_EQ(record.at("message").getString(), msg.message);
}

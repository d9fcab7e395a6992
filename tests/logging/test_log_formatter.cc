#include <regex>

#include <gtest/gtest.h>

#include "realmlink/logging/log_formatter.h"

using namespace realmlink::logging;

namespace {

LogMessage makeMessage() {
  LogMessage msg;
  msg.level = LogLevel::Warning;
  msg.message = "Timeout waiting for response";
  msg.logger_name = "protocol";
  msg.component = Component::Protocol;
  return msg;
}

}  // namespace

TEST(DefaultFormatterTest, TimestampAndLevel) {
  DefaultFormatter formatter;
  std::string line = formatter.format(makeMessage());
  EXPECT_TRUE(std::regex_search(
      line, std::regex(R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}\] \[WARNING\] )")))
      << line;
  EXPECT_NE(line.find("Timeout waiting for response"), std::string::npos);
}

TEST(DefaultFormatterTest, ConnectionPrefix) {
  DefaultFormatter formatter;
  auto msg = makeMessage();
  msg.server_type = "EP";
  msg.zone = "EmpireEx_3";
  std::string line = formatter.format(msg);
  EXPECT_NE(line.find("[WARNING] [EP][EmpireEx_3] Timeout waiting"),
            std::string::npos)
      << line;
}

TEST(DefaultFormatterTest, NoPrefixWithoutConnection) {
  DefaultFormatter formatter;
  std::string line = formatter.format(makeMessage());
  EXPECT_NE(line.find("[WARNING] Timeout"), std::string::npos) << line;
}

TEST(DefaultFormatterTest, KeyValues) {
  DefaultFormatter formatter;
  auto msg = makeMessage();
  msg.key_values["command"] = "gpi";
  msg.key_values["status"] = "0";
  std::string line = formatter.format(msg);
  EXPECT_NE(line.find("{command=gpi, status=0}"), std::string::npos) << line;
}

TEST(JsonFormatterTest, EscapesAndCarriesConnection) {
  JsonFormatter formatter;
  auto msg = makeMessage();
  msg.message = "quote \" and\nnewline";
  msg.server_type = "E4K";
  msg.zone = "EmpirefourkingdomsExGG_7";
  std::string line = formatter.format(msg);
  EXPECT_EQ(line.front(), '{');
  EXPECT_EQ(line.back(), '}');
  EXPECT_NE(line.find("\"level\":\"WARNING\""), std::string::npos);
  EXPECT_NE(line.find("\"server_type\":\"E4K\""), std::string::npos);
  EXPECT_NE(line.find("\"zone\":\"EmpirefourkingdomsExGG_7\""),
            std::string::npos);
  EXPECT_NE(line.find("quote \\\" and\\nnewline"), std::string::npos) << line;
}

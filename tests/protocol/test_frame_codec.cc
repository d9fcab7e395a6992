#include <string>

#include <gtest/gtest.h>

#include "realmlink/protocol/frame_codec.h"

namespace realmlink {
namespace protocol {
namespace {

using json = nlohmann::json;

const DelimitedFrame& delimited(const Result<ParsedResponse>& result) {
  return get<DelimitedFrame>(getValue(result));
}

TEST(FrameCodecTest, ParsesDelimitedJsonPayload) {
  auto result = parseFrame(R"(%xt%gpi%1%0%{"k":1}%)");
  ASSERT_FALSE(isError(result));
  const auto& frame = delimited(result);
  EXPECT_EQ(frame.command, "gpi");
  EXPECT_EQ(frame.status, 0);
  EXPECT_EQ(frame.payload, json::parse(R"({"k":1})"));
}

TEST(FrameCodecTest, MissingPayloadIsNull) {
  auto result = parseFrame("%xt%lli%1%0%");
  ASSERT_FALSE(isError(result));
  EXPECT_TRUE(delimited(result).payload.is_null());
}

TEST(FrameCodecTest, NonJsonPayloadKeptAsString) {
  auto result = parseFrame("%xt%pin%1%0%<RoundHouseKick>%");
  ASSERT_FALSE(isError(result));
  EXPECT_EQ(delimited(result).payload, json("<RoundHouseKick>"));
}

TEST(FrameCodecTest, PayloadContainingDelimiterIsRejoined) {
  auto result = parseFrame(R"(%xt%msg%1%0%{"t":"50%off"}%)");
  ASSERT_FALSE(isError(result));
  EXPECT_EQ(delimited(result).payload["t"], "50%off");
}

TEST(FrameCodecTest, NegativeStatus) {
  auto result = parseFrame("%xt%lli%1%-1%");
  ASSERT_FALSE(isError(result));
  EXPECT_EQ(delimited(result).status, -1);
}

TEST(FrameCodecTest, TooFewSegmentsIsParseError) {
  auto result = parseFrame("%xt%gpi%");
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, errors::kParseError);
}

TEST(FrameCodecTest, NonIntegerStatusIsParseError) {
  auto result = parseFrame("%xt%gpi%1%ok%");
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, errors::kParseError);
}

TEST(FrameCodecTest, BrokenJsonIsParseError) {
  auto result = parseFrame("%xt%gpi%1%0%{\"k\":%");
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, errors::kParseError);
}

TEST(FrameCodecTest, ParsesXmlFrame) {
  auto result = parseFrame(
      "<msg t='sys'><body action='apiOK' r='0'><ver v='166'/></body></msg>");
  ASSERT_FALSE(isError(result));
  const auto& frame = get<XmlFrame>(getValue(result));
  EXPECT_EQ(frame.tag, "sys");
  EXPECT_EQ(frame.action, "apiOK");
  EXPECT_EQ(frame.room, "0");
  EXPECT_EQ(frame.body, "<ver v='166'/>");
}

TEST(FrameCodecTest, MalformedXmlIsParseError) {
  auto result = parseFrame("<msg t='sys'><body>");
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, errors::kParseError);
}

TEST(FrameCodecTest, XmlFrameMissingCloseIsParseError) {
  auto result = parseFrame("<msg t='sys'><body action='apiOK' r='0'>abc");
  ASSERT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, errors::kParseError);
}

TEST(FrameCodecTest, ParsesMegabyteXmlBody) {
  const std::string body(2 * 1024 * 1024, 'a');
  auto result =
      parseFrame("<msg t='sys'><body action='x' r='0'>" + body + "</body></msg>");
  ASSERT_FALSE(isError(result));
  const auto& frame = get<XmlFrame>(getValue(result));
  EXPECT_EQ(frame.action, "x");
  EXPECT_EQ(frame.body.size(), body.size());

  // An unterminated frame of the same size fails without blowing the stack
  auto broken = parseFrame("<msg t='sys'><body action='x' r='0'>" + body);
  EXPECT_TRUE(isError(broken));
}

TEST(FrameCodecTest, EncodesCommands) {
  EXPECT_EQ(encodeCommand("EmpireEx_3", "pin", {"<RoundHouseKick>"}),
            "%xt%EmpireEx_3%pin%1%<RoundHouseKick>%");
  EXPECT_EQ(encodeCommand("EmpireEx_3", "nop", {}), "%xt%EmpireEx_3%nop%1%");
  EXPECT_EQ(encodeJsonCommand("EmpireEx", "gpi", json::object()),
            "%xt%EmpireEx%gpi%1%{}%");
}

TEST(FrameCodecTest, EncodesXml) {
  EXPECT_EQ(encodeXml("sys", "verChk", "0", "<ver v='166' />"),
            "<msg t='sys'><body action='verChk' r='0'><ver v='166' />"
            "</body></msg>");
}

}  // namespace
}  // namespace protocol
}  // namespace realmlink

#include <gtest/gtest.h>

#include "realmlink/protocol/nested_path.h"

namespace realmlink {
namespace protocol {
namespace {

using json = nlohmann::json;

TEST(SetNestedValueTest, CreatesIntermediateObjects) {
  json object = json::object();
  setNestedValue(object, "a.b.c", 7);
  EXPECT_EQ(object, json::parse(R"({"a":{"b":{"c":7}}})"));
}

TEST(SetNestedValueTest, KeepsSiblings) {
  json object = json::parse(R"({"a":{"x":1}})");
  setNestedValue(object, "a.y", "two");
  EXPECT_EQ(object, json::parse(R"({"a":{"x":1,"y":"two"}})"));
}

TEST(SetNestedValueTest, ReplacesScalarIntermediate) {
  json object = json::parse(R"({"a":5})");
  setNestedValue(object, "a.b", true);
  EXPECT_EQ(object, json::parse(R"({"a":{"b":true}})"));
}

TEST(SetNestedValueTest, SingleSegmentPath) {
  json object;
  setNestedValue(object, "PN", "login");
  EXPECT_EQ(object, json::parse(R"({"PN":"login"})"));
}

TEST(CompareNestedTest, SubsetOfCandidateMatches) {
  EXPECT_TRUE(compareNested(json::parse(R"({"a":{"b":1}})"),
                            json::parse(R"({"a":{"b":1,"c":2}})")));
}

TEST(CompareNestedTest, DifferentValueFails) {
  EXPECT_FALSE(compareNested(json::parse(R"({"a":{"b":1}})"),
                             json::parse(R"({"a":{"b":2}})")));
}

TEST(CompareNestedTest, MissingKeyFails) {
  EXPECT_FALSE(compareNested(json::parse(R"({"a":1,"z":1})"),
                             json::parse(R"({"a":1})")));
}

TEST(CompareNestedTest, ArrayCandidateMatchesAnyElement) {
  const json pattern = json::parse(R"({"id":3})");
  EXPECT_TRUE(compareNested(pattern, json::parse(R"([{"id":1},{"id":3}])")));
  EXPECT_FALSE(compareNested(pattern, json::parse(R"([{"id":1},{"id":2}])")));
}

TEST(CompareNestedTest, NestedArrayInsideObject) {
  EXPECT_TRUE(compareNested(json::parse(R"({"list":{"n":"x"}})"),
                            json::parse(R"({"list":[{"n":"y"},{"n":"x"}]})")));
}

TEST(CompareNestedTest, NullNeverMatches) {
  EXPECT_FALSE(compareNested(json(), json::object()));
  EXPECT_FALSE(compareNested(json::object(), json()));
  EXPECT_FALSE(compareNested(json::parse(R"({"a":null})"),
                             json::parse(R"({"a":null})")));
}

TEST(CompareNestedTest, EmptyPatternMatchesAnyNonNull) {
  EXPECT_TRUE(compareNested(json::object(), json::parse(R"({"a":1})")));
  EXPECT_TRUE(compareNested(json::object(), json::object()));
}

TEST(CompareNestedTest, ScalarsCompareByEquality) {
  EXPECT_TRUE(compareNested(json(5), json(5)));
  EXPECT_FALSE(compareNested(json("5"), json(5)));
}

TEST(CompareNestedTest, ObjectPatternAgainstScalarFails) {
  EXPECT_FALSE(compareNested(json::parse(R"({"a":1})"), json(1)));
}

}  // namespace
}  // namespace protocol
}  // namespace realmlink

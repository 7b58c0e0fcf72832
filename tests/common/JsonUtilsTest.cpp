#include "common/JsonUtils.h"
#include <gtest/gtest.h>

using ESM::JsonUtils;

TEST(JsonUtilsTest, ParsesObjectsWithComments) {
    auto value = JsonUtils::parseJson(R"({
        // comment
        "name": "TrafficLight",
        "diagram_enabled": true,
        "includes": ["<string>", 3, "<vector>"]
    })");

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(JsonUtils::getString(*value, "name"), "TrafficLight");
    EXPECT_TRUE(JsonUtils::getBool(*value, "diagram_enabled"));
    EXPECT_EQ(JsonUtils::getStringArray(*value, "includes"), (std::vector<std::string>{"<string>", "<vector>"}));
}

TEST(JsonUtilsTest, ReportsSyntaxErrors) {
    std::string error;
    auto value = JsonUtils::parseJson("{ \"name\": ", &error);

    EXPECT_FALSE(value.has_value());
    EXPECT_FALSE(error.empty());
}

TEST(JsonUtilsTest, RejectsDuplicateKeys) {
    EXPECT_FALSE(JsonUtils::parseJson(R"({"name": "A", "name": "B"})").has_value());
}

TEST(JsonUtilsTest, MemberTypeChecks) {
    auto value = JsonUtils::parseJson(R"({"s": "x", "b": false, "a": []})");
    ASSERT_TRUE(value.has_value());

    EXPECT_TRUE(JsonUtils::hasKey(*value, "s"));
    EXPECT_FALSE(JsonUtils::hasKey(*value, "missing"));
    EXPECT_TRUE(JsonUtils::isStringMember(*value, "s"));
    EXPECT_FALSE(JsonUtils::isStringMember(*value, "b"));
    EXPECT_TRUE(JsonUtils::isBoolMember(*value, "b"));
    EXPECT_TRUE(JsonUtils::isArrayMember(*value, "a"));
    EXPECT_EQ(JsonUtils::getString(*value, "missing", "fallback"), "fallback");
}

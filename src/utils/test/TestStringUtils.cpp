#include <gtest/gtest.h>

#include "StringUtils.h"


TEST(stringUtilsTest, toLower) {
    EXPECT_EQ(StringUtils::to_lower("Float"), "float");
    EXPECT_EQ(StringUtils::to_lower("BIGINT"), "bigint");
    EXPECT_EQ(StringUtils::to_lower(""), "");
}

TEST(stringUtilsTest, trimInPlace) {
    std::string value = "  \t10.5 \r\n";
    StringUtils::trim(value);
    EXPECT_EQ(value, "10.5");

    std::string blank = "   ";
    StringUtils::trim(blank);
    EXPECT_TRUE(blank.empty());
}

TEST(stringUtilsTest, trimCopyKeepsInnerSpaces) {
    EXPECT_EQ(StringUtils::trim_copy("  SMITH, JOHN  "), "SMITH, JOHN");
    EXPECT_EQ(StringUtils::trim_copy(""), "");
}

TEST(stringUtilsTest, isBlank) {
    EXPECT_TRUE(StringUtils::is_blank(""));
    EXPECT_TRUE(StringUtils::is_blank(" \t"));
    EXPECT_FALSE(StringUtils::is_blank(" x "));
}

TEST(stringUtilsTest, join) {
    EXPECT_EQ(StringUtils::join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(StringUtils::join({}, ", "), "");
}

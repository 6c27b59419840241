#include <gtest/gtest.h>

#include <cmath>
#include "CSVUtils.h"


TEST(csvUtilsTest, parseBigint) {
    EXPECT_EQ(CSVUtils::parse_bigint("2020").value_or(0), 2020);
    EXPECT_EQ(CSVUtils::parse_bigint(" -17 ").value_or(0), -17);
    EXPECT_EQ(CSVUtils::parse_bigint("+5").value_or(0), 5);
    EXPECT_EQ(CSVUtils::parse_bigint("007").value_or(0), 7);
    EXPECT_FALSE(CSVUtils::parse_bigint("").has_value());
    EXPECT_FALSE(CSVUtils::parse_bigint("1.0").has_value());
    EXPECT_FALSE(CSVUtils::parse_bigint("12abc").has_value());
    EXPECT_FALSE(CSVUtils::parse_bigint("+-3").has_value());
    EXPECT_FALSE(CSVUtils::parse_bigint("99999999999999999999").has_value());
}

TEST(csvUtilsTest, parseDouble) {
    EXPECT_DOUBLE_EQ(CSVUtils::parse_double("10.5").value_or(0), 10.5);
    EXPECT_DOUBLE_EQ(CSVUtils::parse_double("1e3").value_or(0), 1000.0);
    EXPECT_DOUBLE_EQ(CSVUtils::parse_double(" -0.25 ").value_or(0), -0.25);
    EXPECT_DOUBLE_EQ(CSVUtils::parse_double("100").value_or(0), 100.0);
    EXPECT_TRUE(std::isnan(CSVUtils::parse_double("nan").value_or(0)));
    EXPECT_TRUE(std::isinf(CSVUtils::parse_double("inf").value_or(0)));
    EXPECT_FALSE(CSVUtils::parse_double("abc").has_value());
    EXPECT_FALSE(CSVUtils::parse_double("1,5").has_value());
    EXPECT_FALSE(CSVUtils::parse_double("").has_value());
}

TEST(csvUtilsTest, convertToType) {
    EXPECT_EQ(std::get<int64_t>(CSVUtils::convert_to_type("96", ColumnTypeTag::BIGINT)), 96);
    EXPECT_DOUBLE_EQ(std::get<double>(CSVUtils::convert_to_type("5.5", ColumnTypeTag::DOUBLE)), 5.5);
    EXPECT_EQ(std::get<std::string>(CSVUtils::convert_to_type(" 00123 ", ColumnTypeTag::VARCHAR)), " 00123 ");

    try {
        CSVUtils::convert_to_type("ten", ColumnTypeTag::DOUBLE);
        FAIL() << "ten is not a float";
    } catch (const std::invalid_argument& e) {
        EXPECT_EQ(std::string(e.what()), "invalid float value");
    }
    EXPECT_THROW(CSVUtils::convert_to_type("1", ColumnTypeTag::BIGINT_LIST), std::invalid_argument);
}

#include <gtest/gtest.h>

#include "ConfigError.h"
#include "TypeConfig.h"


namespace {

    TypeConfig contributions() {
        TypeConfig config;
        config.name = "contributions";
        config.columns = {
            ColumnConfig("transaction.id", "string"),
            ColumnConfig("cycle", "integer"),
            ColumnConfig("amount", "float"),
            ColumnConfig("bonica.cid", "string")
        };
        config.key_columns = {"transaction.id", "bonica.cid"};
        config.checksum_column = "amount";
        return config;
    }

    void expect_config_error(const TypeConfig& config, const std::string& param_path) {
        try {
            config.validate();
            FAIL() << "expected ConfigError at " << param_path;
        } catch (const ConfigError& e) {
            EXPECT_EQ(e.param_path, param_path);
        }
    }

}


TEST(typeConfigTest, defaults) {
    TypeConfig config;
    EXPECT_EQ(config.null_tokens, (std::vector<std::string>{"\\N", ""}));
    EXPECT_EQ(config.default_sample_size, 1000u);
    EXPECT_EQ(config.delimiter, ',');
    EXPECT_TRUE(config.has_header);
    EXPECT_FALSE(config.checksum_column.has_value());
}

TEST(typeConfigTest, validConfig) {
    TypeConfig config = contributions();
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.expected_columns().size(), 4u);
    ASSERT_NE(config.find_column("amount"), nullptr);
    EXPECT_EQ(config.find_column("amount")->type_tag, ColumnTypeTag::DOUBLE);
    EXPECT_EQ(config.find_column("missing"), nullptr);
}

TEST(typeConfigTest, nullTokens) {
    TypeConfig config = contributions();
    EXPECT_TRUE(config.is_null_token("\\N"));
    EXPECT_TRUE(config.is_null_token(""));
    EXPECT_FALSE(config.is_null_token("N/A"));
    EXPECT_FALSE(config.is_null_token(" "));
}

TEST(typeConfigTest, rejectsInconsistentDescriptors) {
    TypeConfig empty = contributions();
    empty.columns.clear();
    expect_config_error(empty, "columns");

    TypeConfig duplicate = contributions();
    duplicate.columns.push_back(ColumnConfig("cycle", "integer"));
    expect_config_error(duplicate, "columns[4]");

    TypeConfig unknown_key = contributions();
    unknown_key.key_columns.push_back("recipient.id");
    expect_config_error(unknown_key, "key_columns");

    TypeConfig text_checksum = contributions();
    text_checksum.checksum_column = "bonica.cid";
    expect_config_error(text_checksum, "checksum_column");

    TypeConfig missing_checksum = contributions();
    missing_checksum.checksum_column = "total";
    expect_config_error(missing_checksum, "checksum_column");

    TypeConfig zero_sample = contributions();
    zero_sample.default_sample_size = 0;
    expect_config_error(zero_sample, "default_sample_size");

    TypeConfig list_column = contributions();
    list_column.columns.push_back(ColumnConfig("congresses", ColumnTypeTag::BIGINT_LIST));
    expect_config_error(list_column, "columns[4].type");
}

TEST(typeConfigTest, emptyNullTokenSetAllowed) {
    TypeConfig config = contributions();
    config.null_tokens.clear();
    EXPECT_NO_THROW(config.validate());
    EXPECT_FALSE(config.is_null_token(""));
}

TEST(checksumToleranceTest, absoluteFloorAndRelative) {
    ChecksumTolerance tolerance;
    EXPECT_DOUBLE_EQ(tolerance.allowed(100.0), 0.01);
    EXPECT_DOUBLE_EQ(tolerance.allowed(1e12), 1e6);
    EXPECT_TRUE(tolerance.within(135.5, 135.505));
    EXPECT_FALSE(tolerance.within(135.5, 135.52));
    EXPECT_TRUE(tolerance.within(1e12, 1e12 + 5e5));
    EXPECT_TRUE(tolerance.within(-1e12, -1e12 - 5e5));
}

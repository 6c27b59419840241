#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include "RowSampler.h"
#include "SchemaValidator.h"
#include "ConvertError.h"


TEST(rowSamplerTest, distinctSortedInRange) {
    RowSampler sampler(11);
    auto picks = sampler.sample(1000, 100);
    ASSERT_EQ(picks.size(), 100u);
    EXPECT_TRUE(std::is_sorted(picks.begin(), picks.end()));
    EXPECT_EQ(std::set<int64_t>(picks.begin(), picks.end()).size(), 100u);
    EXPECT_GE(picks.front(), 0);
    EXPECT_LT(picks.back(), 1000);
}

TEST(rowSamplerTest, seedReproducible) {
    RowSampler first(2024);
    RowSampler second(2024);
    EXPECT_EQ(first.sample(50000, 30), second.sample(50000, 30));
    EXPECT_EQ(first.seed(), 2024u);
}

TEST(rowSamplerTest, collidingDrawsStayDistinct) {
    // k close to the population makes repeated draws the common case
    for (uint64_t seed = 0; seed < 64; ++seed) {
        RowSampler sampler(seed);
        auto picks = sampler.sample(20, 19);
        ASSERT_EQ(picks.size(), 19u) << "seed " << seed;
        EXPECT_EQ(std::set<int64_t>(picks.begin(), picks.end()).size(), 19u) << "seed " << seed;
        EXPECT_TRUE(std::is_sorted(picks.begin(), picks.end()));
        EXPECT_LT(picks.back(), 20);
    }
}

TEST(rowSamplerTest, smallPopulation) {
    RowSampler sampler(5);
    std::vector<int64_t> all = {0, 1, 2, 3};
    EXPECT_EQ(sampler.sample(4, 100), all);
    EXPECT_TRUE(sampler.sample(0, 10).empty());
    EXPECT_TRUE(sampler.sample(10, 0).empty());
}

TEST(schemaValidatorTest, declaredSetMustMatch) {
    TypeConfig config;
    config.name = "voteview_rollcalls";
    config.columns = {
        ColumnConfig("congress", "integer"),
        ColumnConfig("rollnumber", "integer"),
        ColumnConfig("yea_count", "integer")
    };

    EXPECT_NO_THROW(SchemaValidator::validate(config.columns, config, "rollcalls.csv"));

    ColumnConfigVector observed = {
        ColumnConfig("rollnumber", "integer"),
        ColumnConfig("congress", "integer"),
        ColumnConfig("nay_count", "string")
    };
    try {
        SchemaValidator::validate(observed, config, "rollcalls.csv");
        FAIL() << "yea_count is missing";
    } catch (const SchemaValidationError& e) {
        EXPECT_EQ(e.missing(), std::vector<std::string>{"yea_count"});
        EXPECT_EQ(e.extra(), std::vector<std::string>{"nay_count"});
    }

    ColumnConfigVector retyped = {
        ColumnConfig("congress", "integer"),
        ColumnConfig("rollnumber", "string"),
        ColumnConfig("yea_count", "integer")
    };
    EXPECT_THROW(SchemaValidator::validate(retyped, config, "rollcalls.csv"), SchemaValidationError);
}

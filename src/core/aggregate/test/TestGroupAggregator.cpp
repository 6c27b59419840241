#include <gtest/gtest.h>

#include <cstdio>
#include <limits>
#include "AggregationSource.h"
#include "AggregationValidator.h"
#include "ColumnarReader.h"
#include "ColumnarWriter.h"
#include "ConfigError.h"
#include "ConvertError.h"
#include "GroupAggregator.h"


namespace {

    std::string temp_path(const std::string& name) {
        return testing::TempDir() + "pfconvert_aggregate_" + name;
    }

    ColumnConfigVector member_schema() {
        return {
            ColumnConfig("bioguide_id", "string"),
            ColumnConfig("congress", "integer"),
            ColumnConfig("chamber", "string"),
            ColumnConfig("bioname", "string"),
            ColumnConfig("nominate_dim1", "float")
        };
    }

    RowType member(ColumnType id, ColumnType congress, const std::string& chamber,
                   const std::string& name, ColumnType dim1) {
        return {std::move(id), std::move(congress), chamber, name, std::move(dim1)};
    }

    // Members table in two row groups
    std::string write_members(const std::string& name) {
        const std::string path = temp_path(name);
        ColumnarWriter writer(path, member_schema());

        ColumnBatch first(member_schema());
        first.append_row(member(std::string("X"), int64_t(2020), "House", "X MID", 0.10));
        first.append_row(member(std::string("Y"), int64_t(2018), "Senate", "Y ONE", -0.40));
        first.append_row(member(std::string("X"), int64_t(2018), "House", "X OLD", std::monostate{}));
        first.append_row(member(std::string("X"), int64_t(2022), "House", "X NEW", 0.30));
        writer.write_batch(first);

        ColumnBatch second(member_schema());
        second.append_row(member(std::string("Z"), int64_t(2020), "President", "Z PRES", 0.50));
        second.append_row(member(std::string("Y"), int64_t(2018), "Senate", "Y TWO", -0.20));
        second.append_row(member(std::monostate{}, int64_t(2020), "House", "NOBODY", 0.00));
        second.append_row(member(std::string("W"), std::monostate{}, "House", "W UNDATED", 0.00));
        writer.write_batch(second);

        writer.close();
        return path;
    }

    AggregationConfig legislator_config() {
        AggregationConfig config;
        config.name = "distinct_legislators";
        config.group_key = "bioguide_id";
        config.order_column = "congress";
        config.filters = {FilterConfig{"chamber", FilterOp::NE, "President"}};
        config.fields = {
            FieldConfig{"congresses_served", "congress", ReduceKind::LIST},
            FieldConfig{"bioname", "bioname", ReduceKind::LAST},
            FieldConfig{"first_bioname", "bioname", ReduceKind::FIRST},
            FieldConfig{"first_congress", "congress", ReduceKind::MIN},
            FieldConfig{"last_congress", "congress", ReduceKind::MAX},
            FieldConfig{"max_dim1", "nominate_dim1", ReduceKind::MAX},
            FieldConfig{"n_records", "", ReduceKind::COUNT}
        };
        config.aggregation_sample_size = 100;
        config.deep_sample_size = 100;
        return config;
    }

    ConvertOptions aggregate_options() {
        ConvertOptions options;
        options.batch_size = 1;
        options.seed = 17;
        return options;
    }

    // Output file written by hand from the given rows
    std::string write_output(const std::string& name, const std::vector<RowType>& rows) {
        const std::string path = temp_path(name);
        ColumnConfigVector schema = GroupAggregator::output_schema(legislator_config(), member_schema());
        ColumnBatch batch(schema);
        for (const auto& row : rows) {
            batch.append_row(RowType(row));
        }
        ColumnarWriter writer(path, schema);
        writer.write_batch(batch);
        writer.close();
        return path;
    }

    RowType group_x() {
        return {std::string("X"), BigintList{2018, 2020, 2022}, std::string("X NEW"), std::string("X OLD"),
                int64_t(2018), int64_t(2022), 0.30, int64_t(3)};
    }

    RowType group_y() {
        return {std::string("Y"), BigintList{2018, 2018}, std::string("Y TWO"), std::string("Y ONE"),
                int64_t(2018), int64_t(2018), -0.20, int64_t(2)};
    }

}


TEST(groupAggregatorTest, oneRowPerKey) {
    auto source = write_members("members.parquet");
    auto output = temp_path("legislators.parquet");

    GroupAggregator aggregator(legislator_config(), aggregate_options());
    AggregationResult result = aggregator.aggregate(source, output);
    EXPECT_EQ(result.source_rows, 5);
    EXPECT_EQ(result.output_count, 2);
    ASSERT_TRUE(result.validation.has_value());
    EXPECT_TRUE(result.is_valid());
    EXPECT_EQ(result.validation->source_distinct_count, 2);
    EXPECT_EQ(result.validation->sample_size, 2u);
    EXPECT_GT(result.validation->aggregation_checks_passed, 0);

    ColumnarReader reader(output);
    EXPECT_EQ(reader.num_rows(), 2u);
    EXPECT_EQ(reader.num_row_groups(), 2u);
    EXPECT_EQ(column_names(reader.schema()), legislator_config().output_columns());
    EXPECT_EQ(reader.schema()[1].type_tag, ColumnTypeTag::BIGINT_LIST);
    EXPECT_EQ(reader.schema()[7].type_tag, ColumnTypeTag::BIGINT);
    EXPECT_EQ(reader.metadata_value("pfconvert.group_key").value_or(""), "bioguide_id");

    auto rows = reader.read_rows({0, 1});
    EXPECT_EQ(rows[0], group_x());
    EXPECT_EQ(rows[1], group_y());

    std::remove(source.c_str());
    std::remove(output.c_str());
}

TEST(groupAggregatorTest, numericFilter) {
    auto source = write_members("members_recent.parquet");
    auto output = temp_path("recent.parquet");

    AggregationConfig config = legislator_config();
    config.filters.push_back(FilterConfig{"congress", FilterOp::GE, "2020"});

    GroupAggregator aggregator(config, aggregate_options());
    AggregationResult result = aggregator.aggregate(source, output);
    EXPECT_EQ(result.source_rows, 2);
    EXPECT_EQ(result.output_count, 1);
    EXPECT_TRUE(result.is_valid());

    ColumnarReader reader(output);
    auto rows = reader.read_rows({0});
    EXPECT_EQ(std::get<std::string>(rows[0][0]), "X");
    EXPECT_EQ(std::get<BigintList>(rows[0][1]), (BigintList{2020, 2022}));
    EXPECT_EQ(std::get<std::string>(rows[0][3]), "X MID");

    std::remove(source.c_str());
    std::remove(output.c_str());
}

TEST(groupAggregatorTest, nanKeysAndOrderingsSkipped) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    ColumnConfigVector schema = {
        ColumnConfig("member_id", "float"),
        ColumnConfig("term", "float"),
        ColumnConfig("name", "string")
    };
    auto source = temp_path("terms.parquet");
    {
        ColumnBatch batch(schema);
        batch.append_row({1.0, 2020.0, std::string("A 2020")});
        batch.append_row({1.0, nan, std::string("A UNDATED")});
        batch.append_row({1.0, 2018.0, std::string("A 2018")});
        batch.append_row({nan, 2019.0, std::string("NO KEY")});
        batch.append_row({2.0, 2021.0, std::string("B 2021")});
        ColumnarWriter writer(source, schema);
        writer.write_batch(batch);
        writer.close();
    }

    AggregationConfig config;
    config.name = "terms";
    config.group_key = "member_id";
    config.order_column = "term";
    config.fields = {
        FieldConfig{"latest_name", "name", ReduceKind::LAST},
        FieldConfig{"earliest_name", "name", ReduceKind::FIRST},
        FieldConfig{"n_terms", "", ReduceKind::COUNT}
    };

    auto output = temp_path("terms_out.parquet");
    GroupAggregator aggregator(config, aggregate_options());
    AggregationResult result = aggregator.aggregate(source, output);
    EXPECT_EQ(result.source_rows, 3);
    EXPECT_EQ(result.output_count, 2);
    EXPECT_TRUE(result.is_valid());

    ColumnarReader reader(output);
    auto rows = reader.read_rows({0, 1});
    EXPECT_EQ(rows[0], (RowType{1.0, std::string("A 2020"), std::string("A 2018"), int64_t(2)}));
    EXPECT_EQ(rows[1], (RowType{2.0, std::string("B 2021"), std::string("B 2021"), int64_t(1)}));

    std::remove(source.c_str());
    std::remove(output.c_str());
}

TEST(groupAggregatorTest, sourceRequirements) {
    auto source = write_members("members_bad.parquet");

    AggregationConfig missing = legislator_config();
    missing.fields.push_back(FieldConfig{"party", "party_code", ReduceKind::LAST});
    EXPECT_THROW(AggregationSource bound(source, missing), SchemaValidationError);

    AggregationConfig text_list = legislator_config();
    text_list.fields.push_back(FieldConfig{"chambers", "chamber", ReduceKind::LIST});
    EXPECT_THROW(AggregationSource bound(source, text_list), ConfigError);

    AggregationConfig bad_filter = legislator_config();
    bad_filter.filters.push_back(FilterConfig{"congress", FilterOp::GT, "recent"});
    EXPECT_THROW(AggregationSource bound(source, bad_filter), ConfigError);

    std::remove(source.c_str());
}

TEST(aggregationValidatorTest, missingAndDuplicateKeys) {
    auto source = write_members("members_complete.parquet");
    AggregationValidator validator(legislator_config(), 5);

    auto missing = write_output("missing_y.parquet", {group_x()});
    AggregationValidationResult result;
    try {
        validator.validate_completeness(source, missing, result);
        FAIL() << "Y is absent";
    } catch (const CompletenessError& e) {
        EXPECT_EQ(e.expected_count, 2);
        EXPECT_EQ(e.actual_count, 1);
        EXPECT_EQ(e.missing_keys, std::vector<std::string>{"Y"});
        EXPECT_TRUE(e.extra_keys.empty());
    }
    EXPECT_FALSE(result.completeness_valid);

    auto duplicated = write_output("duplicate_x.parquet", {group_x(), group_x(), group_y()});
    try {
        validator.validate_completeness(source, duplicated, result);
        FAIL() << "X appears twice";
    } catch (const CompletenessError& e) {
        EXPECT_EQ(e.duplicate_keys, std::vector<std::string>{"X"});
        EXPECT_TRUE(e.missing_keys.empty());
    }

    std::remove(source.c_str());
    std::remove(missing.c_str());
    std::remove(duplicated.c_str());
}

TEST(aggregationValidatorTest, wrongCountCaught) {
    auto source = write_members("members_count.parquet");
    RowType bad = group_x();
    bad[7] = int64_t(4);
    auto output = write_output("bad_count.parquet", {bad, group_y()});

    AggregationValidator validator(legislator_config(), 5);
    try {
        validator.run(source, output);
        FAIL() << "X has three records";
    } catch (const AggregationError& e) {
        EXPECT_EQ(e.key, "X");
        EXPECT_EQ(e.field_name, "n_records");
        EXPECT_EQ(e.expected, "3");
        EXPECT_EQ(e.actual, "4");
    }

    std::remove(source.c_str());
    std::remove(output.c_str());
}

TEST(aggregationValidatorTest, shortListCaught) {
    auto source = write_members("members_list.parquet");
    RowType bad = group_y();
    bad[1] = BigintList{2018};
    auto output = write_output("short_list.parquet", {group_x(), bad});

    AggregationValidator validator(legislator_config(), 5);
    AggregationValidationResult result;
    try {
        validator.validate_integrity(source, output, result);
        FAIL() << "Y served twice";
    } catch (const AggregationError& e) {
        EXPECT_EQ(e.field_name, "congresses_served (length)");
        EXPECT_EQ(e.expected, "2");
        EXPECT_EQ(e.actual, "1");
    }

    std::remove(source.c_str());
    std::remove(output.c_str());
}

TEST(aggregationValidatorTest, wrongLastValueCaught) {
    auto source = write_members("members_last.parquet");
    RowType bad = group_x();
    bad[2] = std::string("X MID");
    auto output = write_output("bad_last.parquet", {bad, group_y()});

    AggregationValidator validator(legislator_config(), 5);
    try {
        validator.run(source, output);
        FAIL() << "latest X record is X NEW";
    } catch (const SampleMismatchError& e) {
        EXPECT_EQ(e.row_index, 0);
        EXPECT_EQ(e.column_name, "bioname");
        EXPECT_EQ(e.expected, "X NEW");
        EXPECT_EQ(e.actual, "X MID");
        EXPECT_EQ(e.key.value_or(""), "X");
    }

    std::remove(source.c_str());
    std::remove(output.c_str());
}

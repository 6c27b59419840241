#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <limits>
#include "ResultReport.h"


namespace {

    ConversionResult valid_conversion() {
        ConversionResult result;
        result.source_path = "contribDB_2020.csv.gz";
        result.output_path = "contribDB_2020.parquet";
        result.row_count = 5;
        result.stats.row_count = 5;
        result.stats.checksum_sum = 135.5;
        result.stats.non_null_counts["transaction.id"] = 5;
        result.stats.observed_schema = {ColumnConfig("transaction.id", "string"), ColumnConfig("amount", "float")};
        result.stats.batch_count = 1;

        ValidationResult validation;
        validation.row_count_valid = true;
        validation.row_count_expected = 5;
        validation.row_count_actual = 5;
        validation.checksum_valid = true;
        validation.checksum_column = "amount";
        validation.checksum_expected = 135.5;
        validation.checksum_actual = 135.5;
        validation.non_null_counts["transaction.id"] = {5, 5};
        validation.sample_valid = true;
        validation.sample_size = 5;
        result.validation = validation;
        return result;
    }

}


TEST(resultReportTest, conversionSuccess) {
    json report = ResultReport::success("convert", valid_conversion());
    EXPECT_EQ(report["command"], "convert");
    EXPECT_EQ(report["status"], "ok");

    const json& result = report["result"];
    EXPECT_EQ(result["row_count"], 5);
    EXPECT_EQ(result["stats"]["observed_schema"][1]["type"], "double");
    EXPECT_EQ(result["stats"]["non_null_counts"]["transaction.id"], 5);

    const json& validation = result["validation"];
    EXPECT_TRUE(validation["all_valid"].get<bool>());
    EXPECT_EQ(validation["row_count"]["expected"], 5);
    EXPECT_EQ(validation["checksum"]["column"], "amount");
    EXPECT_DOUBLE_EQ(validation["checksum"]["actual"].get<double>(), 135.5);
    EXPECT_EQ(validation["checksum"]["non_null_counts"]["transaction.id"]["actual"], 5);
    EXPECT_EQ(validation["sample"]["size"], 5);
}

TEST(resultReportTest, unvalidatedConversion) {
    ConversionResult result = valid_conversion();
    result.validation.reset();
    json report = ResultReport::success("convert", result);
    EXPECT_EQ(report["status"], "ok");
    EXPECT_TRUE(report["result"]["validation"].is_null());
}

TEST(resultReportTest, aggregationResult) {
    AggregationResult result;
    result.source_path = "members.parquet";
    result.output_path = "legislators.parquet";
    result.source_rows = 5;
    result.output_count = 2;
    AggregationValidationResult validation;
    validation.completeness_valid = true;
    validation.source_distinct_count = 2;
    validation.output_count = 2;
    validation.aggregation_valid = true;
    validation.aggregation_checks_passed = 10;
    result.validation = validation;

    json report = ResultReport::success("aggregate", result);
    EXPECT_EQ(report["status"], "invalid");
    EXPECT_FALSE(report["result"]["validation"]["all_valid"].get<bool>());
    EXPECT_EQ(report["result"]["validation"]["completeness"]["source_distinct_count"], 2);
    EXPECT_EQ(report["result"]["validation"]["aggregation"]["checks_passed"], 10);
    EXPECT_FALSE(report["result"]["validation"]["sample"]["valid"].get<bool>());
}

TEST(resultReportTest, structuredErrors) {
    CSVParseError parse("contribDB_2020.csv", 2, 4, "amount", "abc", "3,2020,abc,C", "invalid float value");
    json report = ResultReport::failure("convert", parse);
    EXPECT_EQ(report["status"], "error");
    EXPECT_EQ(report["error"]["kind"], "CSVParseError");
    EXPECT_EQ(report["error"]["row_index"], 2);
    EXPECT_EQ(report["error"]["column"], "amount");
    EXPECT_EQ(report["error"]["value"], "abc");

    ChecksumMismatchError missing("amount", 135.5, std::numeric_limits<double>::quiet_NaN(), "out.parquet",
                                  "column missing from output");
    json checksum = ResultReport::failure("convert", missing)["error"];
    EXPECT_EQ(checksum["kind"], "ChecksumMismatchError");
    EXPECT_TRUE(checksum["actual"].is_null());
    // NaN must not leak into the document
    EXPECT_NO_THROW(json::parse(checksum.dump()));

    CompletenessError completeness(3, 2, {"Y"}, {}, {}, "out.parquet");
    json keys = ResultReport::failure("aggregate", completeness)["error"];
    EXPECT_EQ(keys["missing_keys"], json::array({"Y"}));
    EXPECT_EQ(keys["expected_count"], 3);
}

TEST(resultReportTest, writeAndReadBack) {
    const std::string path = testing::TempDir() + "pfconvert_report.json";
    ResultReport::write(path, ResultReport::success("convert", valid_conversion()));

    std::ifstream in(path);
    json read = json::parse(in);
    EXPECT_EQ(read["result"]["output_path"], "contribDB_2020.parquet");
    std::remove(path.c_str());

    EXPECT_THROW(ResultReport::write(testing::TempDir() + "no_such_dir/report.json", json::object()),
                 OutputWriteError);
}

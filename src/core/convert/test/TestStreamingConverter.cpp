#include <gtest/gtest.h>

#include <cmath>
#include <cstdio>
#include <fstream>
#include <zlib.h>
#include "ColumnarReader.h"
#include "ConvertError.h"
#include "DatasetConverter.h"
#include "StreamingConverter.h"


namespace {

    std::string temp_path(const std::string& name) {
        return testing::TempDir() + "pfconvert_convert_" + name;
    }

    std::string write_file(const std::string& name, const std::string& content) {
        const std::string path = temp_path(name);
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    TypeConfig contribution_config() {
        TypeConfig config;
        config.name = "contributions";
        config.columns = {
            ColumnConfig("transaction.id", "string"),
            ColumnConfig("cycle", "integer"),
            ColumnConfig("amount", "float"),
            ColumnConfig("contributor.name", "string")
        };
        config.null_tokens = {"", "NA"};
        config.key_columns = {"transaction.id"};
        config.checksum_column = "amount";
        config.default_sample_size = 100;
        return config;
    }

    const char* CONTRIBUTIONS =
        "transaction.id,cycle,amount,contributor.name\n"
        "00101,2018,10.0,\"SMITH, JOHN\"\n"
        "00102,2020,20.0,JONES\n"
        "00103,2020,,DOE\n"
        "00104,2022,5.5,\"O\"\"BRIEN\"\n"
        "00105,2022,100,NA\n";

    ConvertOptions options_with_batch(size_t batch_size) {
        ConvertOptions options;
        options.batch_size = batch_size;
        options.seed = 42;
        return options;
    }

}


TEST(streamingConverterTest, statsFromSmallSource) {
    auto source = write_file("small.csv", CONTRIBUTIONS);
    auto output = temp_path("small.parquet");

    StreamingConverter converter(contribution_config(), options_with_batch(2));
    StreamingStats stats = converter.convert(source, output);

    EXPECT_EQ(stats.row_count, 5);
    EXPECT_DOUBLE_EQ(stats.checksum_sum, 135.5);
    EXPECT_EQ(stats.non_null_counts.at("transaction.id"), 5);
    EXPECT_EQ(stats.batch_count, 3);
    EXPECT_EQ(stats.observed_schema, contribution_config().columns);

    ColumnarReader reader(output);
    EXPECT_EQ(reader.num_rows(), 5u);
    EXPECT_EQ(reader.num_row_groups(), 3u);
    EXPECT_EQ(reader.metadata_value("pfconvert.dataset").value_or(""), "contributions");
    EXPECT_EQ(reader.metadata_value("pfconvert.row_count").value_or(""), "5");
    EXPECT_DOUBLE_EQ(std::stod(reader.metadata_value("pfconvert.checksum_sum").value_or("0")), 135.5);

    auto rows = reader.read_rows({0, 2, 3, 4});
    // identifiers keep their leading zeros
    EXPECT_EQ(std::get<std::string>(rows[0][0]), "00101");
    EXPECT_EQ(std::get<std::string>(rows[0][3]), "SMITH, JOHN");
    EXPECT_TRUE(is_null(rows[1][2]));
    EXPECT_EQ(std::get<std::string>(rows[2][3]), "O\"BRIEN");
    EXPECT_TRUE(is_null(rows[3][3]));
    EXPECT_EQ(std::get<int64_t>(rows[3][1]), 2022);

    std::remove(source.c_str());
    std::remove(output.c_str());
}

TEST(streamingConverterTest, checksumIndependentOfBatchSize) {
    std::string content = "transaction.id,cycle,amount,contributor.name\n";
    for (int i = 0; i < 997; ++i) {
        content += std::to_string(i) + "," + std::to_string(1980 + i % 22 * 2) + "," +
                   std::to_string(i % 7 == 0 ? 0.1 : i * 1.37) + ",DONOR" + std::to_string(i % 13) + "\n";
    }
    auto source = write_file("many.csv", content);
    auto output = temp_path("many.parquet");

    std::vector<double> sums;
    for (size_t batch_size : {1u, 2u, 100u, 100000u}) {
        StreamingConverter converter(contribution_config(), options_with_batch(batch_size));
        StreamingStats stats = converter.convert(source, output);
        EXPECT_EQ(stats.row_count, 997);
        sums.push_back(stats.checksum_sum);
    }
    for (double sum : sums) {
        EXPECT_EQ(sum, sums.front());
    }

    std::remove(source.c_str());
    std::remove(output.c_str());
}

TEST(streamingConverterTest, gzipMatchesPlain) {
    auto plain = write_file("plain.csv", CONTRIBUTIONS);
    const std::string gz = temp_path("plain.csv.gz");
    gzFile file = gzopen(gz.c_str(), "wb");
    std::string content(CONTRIBUTIONS);
    gzwrite(file, content.data(), static_cast<unsigned>(content.size()));
    gzclose(file);

    auto output = temp_path("gz.parquet");
    StreamingConverter converter(contribution_config(), options_with_batch(1000));
    StreamingStats from_plain = converter.convert(plain, output);
    StreamingStats from_gz = converter.convert(gz, output);

    EXPECT_EQ(from_plain.row_count, from_gz.row_count);
    EXPECT_EQ(from_plain.checksum_sum, from_gz.checksum_sum);
    EXPECT_EQ(from_plain.non_null_counts, from_gz.non_null_counts);

    std::remove(plain.c_str());
    std::remove(gz.c_str());
    std::remove(output.c_str());
}

TEST(streamingConverterTest, badValueStopsConversion) {
    auto source = write_file("bad.csv",
                             "transaction.id,cycle,amount,contributor.name\n"
                             "1,2020,10,A\n"
                             "2,2020,20,B\n"
                             "3,2020,abc,C\n"
                             "4,2020,30,D\n");
    auto output = temp_path("bad.parquet");

    StreamingConverter converter(contribution_config(), options_with_batch(1));
    try {
        converter.convert(source, output);
        FAIL() << "abc is not a float";
    } catch (const CSVParseError& e) {
        EXPECT_EQ(e.row_index, 2);
        EXPECT_EQ(e.line_number, 4);
        EXPECT_EQ(e.column_name, "amount");
        EXPECT_EQ(e.value, "abc");
        EXPECT_EQ(e.raw_text, "3,2020,abc,C");
    }
    // nothing is left at the output path
    EXPECT_THROW(ColumnarReader reader(output), SourceUnreadableError);
    std::ifstream partial(output + ".partial");
    EXPECT_FALSE(partial.is_open());

    std::remove(source.c_str());
    std::remove(output.c_str());
}

TEST(streamingConverterTest, fieldCountMismatch) {
    auto source = write_file("short.csv",
                             "transaction.id,cycle,amount,contributor.name\n"
                             "1,2020,10,A\n"
                             "2,2020\n");
    StreamingConverter converter(contribution_config(), options_with_batch(10));
    try {
        converter.convert(source, temp_path("short.parquet"));
        FAIL() << "short row must fail";
    } catch (const CSVParseError& e) {
        EXPECT_EQ(e.row_index, 1);
        EXPECT_EQ(e.reason, "expected 4 fields, found 2");
    }
    std::remove(source.c_str());
    std::remove(temp_path("short.parquet").c_str());
}

TEST(streamingConverterTest, headerOnlySource) {
    auto source = write_file("header_only.csv", "transaction.id,cycle,amount,contributor.name\n");
    auto output = temp_path("header_only.parquet");

    DatasetConverter converter(contribution_config(), options_with_batch(10));
    ConversionResult result = converter.convert(source, output);
    EXPECT_EQ(result.row_count, 0);
    EXPECT_DOUBLE_EQ(result.stats.checksum_sum, 0.0);
    ASSERT_TRUE(result.validation.has_value());
    EXPECT_TRUE(result.is_valid());
    EXPECT_EQ(result.validation->sample_size, 0u);

    ColumnarReader reader(output);
    EXPECT_EQ(reader.num_rows(), 0u);
    EXPECT_EQ(reader.schema().size(), 4u);

    std::remove(source.c_str());
    std::remove(output.c_str());
}

TEST(streamingConverterTest, duplicateHeaderColumns) {
    StreamingConverter converter(contribution_config(), options_with_batch(10));
    CSVRow header = {"transaction.id", "cycle", "amount", "cycle"};
    try {
        converter.resolve_schema(header, "dup.csv");
        FAIL() << "duplicate header must fail";
    } catch (const SchemaValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("cycle"), std::string::npos);
    }
}

TEST(streamingConverterTest, unknownColumnIsSchemaError) {
    auto source = write_file("extra.csv",
                             "transaction.id,cycle,amount,contributor.name,memo\n"
                             "1,2020,10,A,note\n");
    auto schema = StreamingConverter(contribution_config(), options_with_batch(10))
                      .resolve_schema({"transaction.id", "memo"}, source);
    ASSERT_EQ(schema.size(), 2u);
    EXPECT_EQ(schema[1].type_tag, ColumnTypeTag::VARCHAR);

    DatasetConverter converter(contribution_config(), options_with_batch(10));
    try {
        converter.convert(source, temp_path("extra.parquet"));
        FAIL() << "memo is not declared";
    } catch (const SchemaValidationError& e) {
        EXPECT_EQ(e.extra(), std::vector<std::string>{"memo"});
        EXPECT_TRUE(e.missing().empty());
    }
    std::remove(source.c_str());
    std::remove(temp_path("extra.parquet").c_str());
}

TEST(streamingConverterTest, zeroBatchSizeRejected) {
    EXPECT_THROW(StreamingConverter(contribution_config(), options_with_batch(0)), std::invalid_argument);
}

TEST(datasetConverterTest, convertAndValidate) {
    auto source = write_file("dataset.csv", CONTRIBUTIONS);
    auto output = temp_path("dataset.parquet");

    DatasetConverter converter(contribution_config(), options_with_batch(2));
    ConversionResult result = converter.convert(source, output);
    ASSERT_TRUE(result.validation.has_value());
    const ValidationResult& validation = *result.validation;
    EXPECT_TRUE(validation.all_valid());
    EXPECT_EQ(validation.row_count_expected, 5);
    EXPECT_EQ(validation.row_count_actual, 5);
    EXPECT_EQ(validation.checksum_column.value_or(""), "amount");
    EXPECT_DOUBLE_EQ(validation.checksum_actual, 135.5);
    EXPECT_EQ(validation.non_null_counts.at("transaction.id"), (std::pair<int64_t, int64_t>(5, 5)));
    EXPECT_EQ(validation.sample_size, 5u);

    ValidationResult again = converter.validate(source, output, result.stats, 3);
    EXPECT_TRUE(again.all_valid());
    EXPECT_EQ(again.sample_size, 3u);

    std::remove(source.c_str());
    std::remove(output.c_str());
}

TEST(datasetConverterTest, validationDisabled) {
    auto source = write_file("novalidate.csv", CONTRIBUTIONS);
    auto output = temp_path("novalidate.parquet");

    ConvertOptions options = options_with_batch(100);
    options.validate = false;
    DatasetConverter converter(contribution_config(), options);
    ConversionResult result = converter.convert(source, output);
    EXPECT_FALSE(result.validation.has_value());
    EXPECT_TRUE(result.is_valid());
    EXPECT_EQ(result.row_count, 5);

    std::remove(source.c_str());
    std::remove(output.c_str());
}

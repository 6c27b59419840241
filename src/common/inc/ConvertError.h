#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>


enum class ErrorKind {
    SOURCE_UNREADABLE,
    CSV_PARSE,
    SCHEMA_VALIDATION,
    ROW_COUNT_MISMATCH,
    CHECKSUM_MISMATCH,
    SAMPLE_MISMATCH,
    COMPLETENESS,
    AGGREGATION,
    OUTPUT_WRITE
};

const char* error_kind_name(ErrorKind kind) noexcept;


class ConvertError : public std::runtime_error {
public:
    ErrorKind kind;
    std::string path;

    ConvertError(ErrorKind kind, const std::string& msg, const std::string& path = "")
        : runtime_error(msg), kind(kind), path(path) {}
};


class SourceUnreadableError : public ConvertError {
public:
    std::string reason;

    SourceUnreadableError(const std::string& path, const std::string& reason);
};


class CSVParseError : public ConvertError {
public:
    // 0-based data row index, header excluded
    int64_t row_index;
    // 1-based physical line the record starts on
    int64_t line_number;
    std::string column_name;
    std::string value;
    std::string raw_text;
    std::string reason;

    CSVParseError(const std::string& path,
                  int64_t row_index,
                  int64_t line_number,
                  const std::string& column_name,
                  const std::string& value,
                  const std::string& raw_text,
                  const std::string& reason);
};


class SchemaValidationError : public ConvertError {
public:
    std::vector<std::string> expected_columns;
    std::vector<std::string> actual_columns;

    SchemaValidationError(const std::vector<std::string>& expected,
                          const std::vector<std::string>& actual,
                          const std::string& path = "",
                          const std::string& detail = "");

    // Sorted names expected but absent
    std::vector<std::string> missing() const;
    // Sorted names present but not expected
    std::vector<std::string> extra() const;
};


class RowCountMismatchError : public ConvertError {
public:
    int64_t expected;
    int64_t actual;

    RowCountMismatchError(int64_t expected, int64_t actual, const std::string& path = "");

    int64_t diff() const noexcept { return actual - expected; }
};


class ChecksumMismatchError : public ConvertError {
public:
    std::string column_name;
    double expected;
    double actual;

    ChecksumMismatchError(const std::string& column_name, double expected, double actual,
                          const std::string& path = "", const std::string& detail = "");
};


class SampleMismatchError : public ConvertError {
public:
    int64_t row_index;
    std::string column_name;
    std::string expected;
    std::string actual;
    std::optional<std::string> key;

    SampleMismatchError(int64_t row_index,
                        const std::string& column_name,
                        const std::string& expected,
                        const std::string& actual,
                        std::optional<std::string> key = std::nullopt,
                        const std::string& path = "");
};


class CompletenessError : public ConvertError {
public:
    // At most this many example keys are carried per list
    static constexpr size_t MAX_EXAMPLES = 10;

    int64_t expected_count;
    int64_t actual_count;
    std::vector<std::string> missing_keys;
    std::vector<std::string> extra_keys;
    std::vector<std::string> duplicate_keys;

    CompletenessError(int64_t expected_count,
                      int64_t actual_count,
                      std::vector<std::string> missing_keys,
                      std::vector<std::string> extra_keys,
                      std::vector<std::string> duplicate_keys,
                      const std::string& path = "");
};


class AggregationError : public ConvertError {
public:
    std::string key;
    std::string field_name;
    std::string expected;
    std::string actual;

    AggregationError(const std::string& key,
                     const std::string& field_name,
                     const std::string& expected,
                     const std::string& actual,
                     const std::string& path = "");
};


class OutputWriteError : public ConvertError {
public:
    std::string reason;

    OutputWriteError(const std::string& path, const std::string& reason);
};

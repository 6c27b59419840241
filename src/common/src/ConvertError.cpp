#include "ConvertError.h"
#include <algorithm>
#include <iomanip>
#include <iterator>
#include <set>
#include <sstream>
#include "StringUtils.h"


namespace {

    constexpr size_t MAX_VALUE_DISPLAY = 100;

    std::string truncate_value(const std::string& value) {
        if (value.size() <= MAX_VALUE_DISPLAY) {
            return value;
        }
        return value.substr(0, MAX_VALUE_DISPLAY) + "...";
    }

    std::vector<std::string> difference(const std::vector<std::string>& lhs,
                                        const std::vector<std::string>& rhs) {
        std::set<std::string> left(lhs.begin(), lhs.end());
        std::set<std::string> right(rhs.begin(), rhs.end());
        std::vector<std::string> result;
        std::set_difference(left.begin(), left.end(), right.begin(), right.end(),
                            std::back_inserter(result));
        return result;
    }

    std::string format_number(double value) {
        std::ostringstream oss;
        oss << std::setprecision(15) << value;
        return oss.str();
    }

    std::string source_suffix(const std::string& path) {
        return path.empty() ? "" : " [" + path + "]";
    }

    std::string build_parse_message(const std::string& path, int64_t row_index, int64_t line_number,
                                    const std::string& column_name, const std::string& value,
                                    const std::string& raw_text, const std::string& reason) {
        std::ostringstream oss;
        oss << "CSV parse error at row " << row_index << " (line " << line_number << ")";
        if (!column_name.empty()) {
            oss << ", column '" << column_name << "'";
        }
        oss << ": " << reason;
        if (!value.empty()) {
            oss << " (value: '" << truncate_value(value) << "')";
        }
        if (!raw_text.empty()) {
            oss << "\n  raw: " << truncate_value(raw_text);
        }
        oss << source_suffix(path);
        return oss.str();
    }

    std::string build_schema_message(const std::vector<std::string>& missing,
                                     const std::vector<std::string>& extra,
                                     const std::string& path,
                                     const std::string& detail) {
        std::ostringstream oss;
        oss << "Schema validation failed";
        if (!detail.empty()) {
            oss << ": " << detail;
        }
        if (!missing.empty()) {
            oss << "\n  Missing columns: " << StringUtils::join(missing, ", ");
        }
        if (!extra.empty()) {
            oss << "\n  Extra columns: " << StringUtils::join(extra, ", ");
        }
        oss << source_suffix(path);
        return oss.str();
    }

    std::string build_completeness_message(int64_t expected_count, int64_t actual_count,
                                           const std::vector<std::string>& missing,
                                           const std::vector<std::string>& extra,
                                           const std::vector<std::string>& duplicates) {
        std::ostringstream oss;
        oss << "Completeness check failed: expected " << expected_count
            << " distinct keys, got " << actual_count;
        if (!duplicates.empty()) {
            oss << "\n  Duplicate keys: " << StringUtils::join(duplicates, ", ");
        }
        if (!missing.empty()) {
            oss << "\n  Missing keys (first " << missing.size() << "): " << StringUtils::join(missing, ", ");
        }
        if (!extra.empty()) {
            oss << "\n  Extra keys (first " << extra.size() << "): " << StringUtils::join(extra, ", ");
        }
        return oss.str();
    }

    std::vector<std::string> clip(std::vector<std::string> keys) {
        if (keys.size() > CompletenessError::MAX_EXAMPLES) {
            keys.resize(CompletenessError::MAX_EXAMPLES);
        }
        return keys;
    }

}

const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::SOURCE_UNREADABLE:  return "SourceUnreadable";
        case ErrorKind::CSV_PARSE:          return "CSVParseError";
        case ErrorKind::SCHEMA_VALIDATION:  return "SchemaValidationError";
        case ErrorKind::ROW_COUNT_MISMATCH: return "RowCountMismatchError";
        case ErrorKind::CHECKSUM_MISMATCH:  return "ChecksumMismatchError";
        case ErrorKind::SAMPLE_MISMATCH:    return "SampleMismatchError";
        case ErrorKind::COMPLETENESS:       return "CompletenessError";
        case ErrorKind::AGGREGATION:        return "AggregationError";
        case ErrorKind::OUTPUT_WRITE:       return "OutputWriteError";
    }
    return "Unknown";
}

SourceUnreadableError::SourceUnreadableError(const std::string& path, const std::string& reason)
    : ConvertError(ErrorKind::SOURCE_UNREADABLE, "Cannot read source: " + path + " - " + reason, path),
      reason(reason) {}

CSVParseError::CSVParseError(const std::string& path,
                             int64_t row_index,
                             int64_t line_number,
                             const std::string& column_name,
                             const std::string& value,
                             const std::string& raw_text,
                             const std::string& reason)
    : ConvertError(ErrorKind::CSV_PARSE,
                   build_parse_message(path, row_index, line_number, column_name, value, raw_text, reason),
                   path),
      row_index(row_index),
      line_number(line_number),
      column_name(column_name),
      value(value),
      raw_text(raw_text),
      reason(reason) {}

SchemaValidationError::SchemaValidationError(const std::vector<std::string>& expected,
                                             const std::vector<std::string>& actual,
                                             const std::string& path,
                                             const std::string& detail)
    : ConvertError(ErrorKind::SCHEMA_VALIDATION,
                   build_schema_message(difference(expected, actual), difference(actual, expected), path, detail),
                   path),
      expected_columns(expected),
      actual_columns(actual) {}

std::vector<std::string> SchemaValidationError::missing() const {
    return difference(expected_columns, actual_columns);
}

std::vector<std::string> SchemaValidationError::extra() const {
    return difference(actual_columns, expected_columns);
}

RowCountMismatchError::RowCountMismatchError(int64_t expected, int64_t actual, const std::string& path)
    : ConvertError(ErrorKind::ROW_COUNT_MISMATCH,
                   "Row count mismatch: expected " + std::to_string(expected) +
                   ", got " + std::to_string(actual) +
                   " (difference: " + std::to_string(actual - expected) + ")" + source_suffix(path),
                   path),
      expected(expected),
      actual(actual) {}

ChecksumMismatchError::ChecksumMismatchError(const std::string& column_name, double expected, double actual,
                                             const std::string& path, const std::string& detail)
    : ConvertError(ErrorKind::CHECKSUM_MISMATCH,
                   "Checksum mismatch for column '" + column_name + "'" +
                   (detail.empty() ? "" : " (" + detail + ")") +
                   ": expected " + format_number(expected) +
                   ", got " + format_number(actual) + source_suffix(path),
                   path),
      column_name(column_name),
      expected(expected),
      actual(actual) {}

SampleMismatchError::SampleMismatchError(int64_t row_index,
                                         const std::string& column_name,
                                         const std::string& expected,
                                         const std::string& actual,
                                         std::optional<std::string> key,
                                         const std::string& path)
    : ConvertError(ErrorKind::SAMPLE_MISMATCH,
                   "Sample mismatch at row " + std::to_string(row_index) +
                   (key ? " (key " + *key + ")" : "") +
                   ", column '" + column_name + "': expected '" + truncate_value(expected) +
                   "', got '" + truncate_value(actual) + "'" + source_suffix(path),
                   path),
      row_index(row_index),
      column_name(column_name),
      expected(expected),
      actual(actual),
      key(std::move(key)) {}

CompletenessError::CompletenessError(int64_t expected_count,
                                     int64_t actual_count,
                                     std::vector<std::string> missing_keys,
                                     std::vector<std::string> extra_keys,
                                     std::vector<std::string> duplicate_keys,
                                     const std::string& path)
    : ConvertError(ErrorKind::COMPLETENESS,
                   build_completeness_message(expected_count, actual_count,
                                              clip(missing_keys), clip(extra_keys), clip(duplicate_keys)),
                   path),
      expected_count(expected_count),
      actual_count(actual_count),
      missing_keys(clip(std::move(missing_keys))),
      extra_keys(clip(std::move(extra_keys))),
      duplicate_keys(clip(std::move(duplicate_keys))) {}

AggregationError::AggregationError(const std::string& key,
                                   const std::string& field_name,
                                   const std::string& expected,
                                   const std::string& actual,
                                   const std::string& path)
    : ConvertError(ErrorKind::AGGREGATION,
                   "Aggregation mismatch for key " + key + ", field '" + field_name +
                   "': expected " + truncate_value(expected) + ", got " + truncate_value(actual) +
                   source_suffix(path),
                   path),
      key(key),
      field_name(field_name),
      expected(expected),
      actual(actual) {}

OutputWriteError::OutputWriteError(const std::string& path, const std::string& reason)
    : ConvertError(ErrorKind::OUTPUT_WRITE, "Cannot write output: " + path + " - " + reason, path),
      reason(reason) {}

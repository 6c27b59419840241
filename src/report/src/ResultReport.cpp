#include "ResultReport.h"
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>


namespace {

    // NaN marks a column missing from the output, json has no NaN
    json number_or_null(double value) {
        return std::isfinite(value) ? json(value) : json(nullptr);
    }

}

void to_json(json& j, const ColumnConfig& column) {
    j = json{{"name", column.name}, {"type", type_tag_name(column.type_tag)}};
}

void to_json(json& j, const StreamingStats& stats) {
    j = json{
        {"row_count", stats.row_count},
        {"checksum_sum", stats.checksum_sum},
        {"non_null_counts", stats.non_null_counts},
        {"observed_schema", stats.observed_schema},
        {"batch_count", stats.batch_count}
    };
}

void to_json(json& j, const ValidationResult& result) {
    json counts = json::object();
    for (const auto& [column, pair] : result.non_null_counts) {
        counts[column] = {{"expected", pair.first}, {"actual", pair.second}};
    }

    j = json{
        {"all_valid", result.all_valid()},
        {"row_count", {
            {"valid", result.row_count_valid},
            {"expected", result.row_count_expected},
            {"actual", result.row_count_actual}
        }},
        {"checksum", {
            {"valid", result.checksum_valid},
            {"column", result.checksum_column ? json(*result.checksum_column) : json(nullptr)},
            {"expected", number_or_null(result.checksum_expected)},
            {"actual", number_or_null(result.checksum_actual)},
            {"non_null_counts", counts}
        }},
        {"sample", {
            {"valid", result.sample_valid},
            {"size", result.sample_size}
        }}
    };
}

void to_json(json& j, const ConversionResult& result) {
    j = json{
        {"source_path", result.source_path},
        {"output_path", result.output_path},
        {"row_count", result.row_count},
        {"stats", result.stats},
        {"validation", result.validation ? json(*result.validation) : json(nullptr)}
    };
}

void to_json(json& j, const AggregationValidationResult& result) {
    j = json{
        {"all_valid", result.all_valid()},
        {"completeness", {
            {"valid", result.completeness_valid},
            {"source_distinct_count", result.source_distinct_count},
            {"output_count", result.output_count}
        }},
        {"aggregation", {
            {"valid", result.aggregation_valid},
            {"checks_passed", result.aggregation_checks_passed}
        }},
        {"sample", {
            {"valid", result.sample_valid},
            {"size", result.sample_size}
        }}
    };
}

void to_json(json& j, const AggregationResult& result) {
    j = json{
        {"source_path", result.source_path},
        {"output_path", result.output_path},
        {"source_rows", result.source_rows},
        {"output_count", result.output_count},
        {"validation", result.validation ? json(*result.validation) : json(nullptr)}
    };
}

void to_json(json& j, const ConvertError& error) {
    j = json{
        {"kind", error_kind_name(error.kind)},
        {"message", error.what()},
        {"path", error.path}
    };

    // 结构化字段
    if (auto* e = dynamic_cast<const CSVParseError*>(&error)) {
        j["row_index"] = e->row_index;
        j["line_number"] = e->line_number;
        j["column"] = e->column_name;
        j["value"] = e->value;
        j["raw_text"] = e->raw_text;
    } else if (auto* e = dynamic_cast<const SchemaValidationError*>(&error)) {
        j["missing"] = e->missing();
        j["extra"] = e->extra();
    } else if (auto* e = dynamic_cast<const RowCountMismatchError*>(&error)) {
        j["expected"] = e->expected;
        j["actual"] = e->actual;
        j["diff"] = e->diff();
    } else if (auto* e = dynamic_cast<const ChecksumMismatchError*>(&error)) {
        j["column"] = e->column_name;
        j["expected"] = number_or_null(e->expected);
        j["actual"] = number_or_null(e->actual);
    } else if (auto* e = dynamic_cast<const SampleMismatchError*>(&error)) {
        j["row_index"] = e->row_index;
        j["column"] = e->column_name;
        j["expected"] = e->expected;
        j["actual"] = e->actual;
        j["key"] = e->key ? json(*e->key) : json(nullptr);
    } else if (auto* e = dynamic_cast<const CompletenessError*>(&error)) {
        j["expected_count"] = e->expected_count;
        j["actual_count"] = e->actual_count;
        j["missing_keys"] = e->missing_keys;
        j["extra_keys"] = e->extra_keys;
        j["duplicate_keys"] = e->duplicate_keys;
    } else if (auto* e = dynamic_cast<const AggregationError*>(&error)) {
        j["key"] = e->key;
        j["field"] = e->field_name;
        j["expected"] = e->expected;
        j["actual"] = e->actual;
    } else if (auto* e = dynamic_cast<const SourceUnreadableError*>(&error)) {
        j["reason"] = e->reason;
    } else if (auto* e = dynamic_cast<const OutputWriteError*>(&error)) {
        j["reason"] = e->reason;
    }
}

json ResultReport::failure(const std::string& command, const ConvertError& error) {
    json report;
    report["command"] = command;
    report["status"] = "error";
    report["error"] = error;
    return report;
}

void ResultReport::write(const std::string& path, const json& report) {
    errno = 0;
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw OutputWriteError(path, errno ? std::strerror(errno) : "open failed");
    }
    out << report.dump(4) << std::endl;
    if (!out) {
        throw OutputWriteError(path, "write failed");
    }
}

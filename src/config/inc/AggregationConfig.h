#pragma once

#include <optional>
#include <string>
#include <vector>
#include "ColumnConfig.h"


enum class ReduceKind {
    MIN,
    MAX,
    COUNT,
    LIST,
    LAST,
    FIRST
};

enum class FilterOp {
    GE,
    GT,
    LE,
    LT,
    EQ,
    NE,
    NOT_NULL
};

ReduceKind parse_reduce_kind(const std::string& str);
const char* reduce_kind_name(ReduceKind kind) noexcept;

FilterOp parse_filter_op(const std::string& str);
const char* filter_op_name(FilterOp op) noexcept;


struct FilterConfig {
    std::string column;
    FilterOp op = FilterOp::NOT_NULL;
    // Literal operand, typed against the source column when bound
    std::string value;
};

struct FieldConfig {
    std::string name;
    std::string source;
    ReduceKind reduce = ReduceKind::LAST;

    // Output type for a given source column type
    ColumnTypeTag output_type(ColumnTypeTag source_type) const noexcept;
};

struct AggregationConfig {
    std::string name;
    std::string group_key;
    std::string order_column;
    std::vector<FilterConfig> filters;
    std::vector<FieldConfig> fields;
    size_t aggregation_sample_size = 100;
    size_t deep_sample_size = 50;

    // group_key followed by field names
    std::vector<std::string> output_columns() const;

    // Source columns that must be read
    std::vector<std::string> required_columns() const;

    // Throws ConfigError on an inconsistent descriptor
    void validate() const;
};

#include "AggregationConfig.h"
#include <algorithm>
#include <unordered_set>
#include "ConfigError.h"
#include "StringUtils.h"


ReduceKind parse_reduce_kind(const std::string& str) {
    std::string lower = StringUtils::to_lower(str);
    if (lower == "min")   return ReduceKind::MIN;
    if (lower == "max")   return ReduceKind::MAX;
    if (lower == "count") return ReduceKind::COUNT;
    if (lower == "list")  return ReduceKind::LIST;
    if (lower == "last")  return ReduceKind::LAST;
    if (lower == "first") return ReduceKind::FIRST;

    ConfigError error("Unsupported reduce: " + str, "reduce");
    error.suggestions = {"min", "max", "count", "list", "last", "first"};
    throw error;
}

const char* reduce_kind_name(ReduceKind kind) noexcept {
    switch (kind) {
        case ReduceKind::MIN:   return "min";
        case ReduceKind::MAX:   return "max";
        case ReduceKind::COUNT: return "count";
        case ReduceKind::LIST:  return "list";
        case ReduceKind::LAST:  return "last";
        case ReduceKind::FIRST: return "first";
    }
    return "unknown";
}

FilterOp parse_filter_op(const std::string& str) {
    std::string lower = StringUtils::to_lower(str);
    if (lower == ">=") return FilterOp::GE;
    if (lower == ">")  return FilterOp::GT;
    if (lower == "<=") return FilterOp::LE;
    if (lower == "<")  return FilterOp::LT;
    if (lower == "==" || lower == "=") return FilterOp::EQ;
    if (lower == "!=") return FilterOp::NE;
    if (lower == "not_null" || lower == "is_not_null") return FilterOp::NOT_NULL;

    ConfigError error("Unsupported filter op: " + str, "op");
    error.suggestions = {">=", ">", "<=", "<", "==", "!=", "not_null"};
    throw error;
}

const char* filter_op_name(FilterOp op) noexcept {
    switch (op) {
        case FilterOp::GE:       return ">=";
        case FilterOp::GT:       return ">";
        case FilterOp::LE:       return "<=";
        case FilterOp::LT:       return "<";
        case FilterOp::EQ:       return "==";
        case FilterOp::NE:       return "!=";
        case FilterOp::NOT_NULL: return "not_null";
    }
    return "unknown";
}

ColumnTypeTag FieldConfig::output_type(ColumnTypeTag source_type) const noexcept {
    switch (reduce) {
        case ReduceKind::COUNT: return ColumnTypeTag::BIGINT;
        case ReduceKind::LIST:  return ColumnTypeTag::BIGINT_LIST;
        default:                return source_type;
    }
}

std::vector<std::string> AggregationConfig::output_columns() const {
    std::vector<std::string> columns;
    columns.reserve(fields.size() + 1);
    columns.push_back(group_key);
    for (const auto& field : fields) {
        columns.push_back(field.name);
    }
    return columns;
}

std::vector<std::string> AggregationConfig::required_columns() const {
    std::vector<std::string> columns;
    auto add = [&columns](const std::string& column) {
        if (std::find(columns.begin(), columns.end(), column) == columns.end()) {
            columns.push_back(column);
        }
    };

    add(group_key);
    add(order_column);
    for (const auto& filter : filters) {
        add(filter.column);
    }
    for (const auto& field : fields) {
        if (field.reduce != ReduceKind::COUNT) {
            add(field.source);
        }
    }
    return columns;
}

void AggregationConfig::validate() const {
    if (name.empty()) {
        throw ConfigError("Aggregation configuration requires a name", "name");
    }
    if (group_key.empty()) {
        throw ConfigError("Aggregation requires a group_key", "group_key");
    }
    if (order_column.empty()) {
        throw ConfigError("Aggregation requires an order_column", "order_column");
    }
    if (fields.empty()) {
        throw ConfigError("Aggregation '" + name + "' declares no fields", "fields");
    }

    std::unordered_set<std::string> names = {group_key};
    for (size_t i = 0; i < fields.size(); ++i) {
        const auto& field = fields[i];
        const std::string path = "fields[" + std::to_string(i) + "]";
        if (field.name.empty()) {
            throw ConfigError("Field name must not be empty", path);
        }
        if (!names.insert(field.name).second) {
            throw ConfigError("Duplicate output column: " + field.name, path);
        }
        if (field.source.empty() && field.reduce != ReduceKind::COUNT) {
            throw ConfigError("Field '" + field.name + "' requires a source column", path + ".source");
        }
    }

    for (size_t i = 0; i < filters.size(); ++i) {
        const auto& filter = filters[i];
        const std::string path = "filters[" + std::to_string(i) + "]";
        if (filter.column.empty()) {
            throw ConfigError("Filter requires a column", path);
        }
        if (filter.op != FilterOp::NOT_NULL && filter.value.empty()) {
            throw ConfigError("Filter on '" + filter.column + "' requires a value", path + ".value");
        }
    }

    if (aggregation_sample_size == 0 || deep_sample_size == 0) {
        throw ConfigError("Sample sizes must be positive", "aggregation_sample_size");
    }
}

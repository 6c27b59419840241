#include "ColumnConfig.h"
#include <stdexcept>
#include "StringUtils.h"


ColumnTypeTag ColumnConfig::get_type_tag(const std::string& type_str) {
    std::string lower_type = StringUtils::to_lower(type_str);
    StringUtils::trim(lower_type);
    if (lower_type == "integer" || lower_type == "int" || lower_type == "bigint" ||
        lower_type == "int64" || lower_type == "int32" || lower_type == "int16")
        return ColumnTypeTag::BIGINT;
    if (lower_type == "float" || lower_type == "double" || lower_type == "float64")
        return ColumnTypeTag::DOUBLE;
    if (lower_type == "string" || lower_type == "varchar" || lower_type == "text")
        return ColumnTypeTag::VARCHAR;
    if (lower_type == "list<bigint>" || lower_type == "list<integer>")
        return ColumnTypeTag::BIGINT_LIST;
    throw std::runtime_error("Unsupported type: " + lower_type);
}

ColumnConfig::ColumnConfig(const std::string& name, const std::string& type)
    : name(name), type(type) {
    type_tag = get_type_tag(type);
}

ColumnConfig::ColumnConfig(const std::string& name, ColumnTypeTag type_tag)
    : name(name), type(type_tag_name(type_tag)), type_tag(type_tag) {}

void ColumnConfig::calc_type_tag() {
    type_tag = get_type_tag(type);
}

bool ColumnConfig::is_numeric() const noexcept {
    return is_numeric_tag(type_tag);
}

std::vector<std::string> column_names(const ColumnConfigVector& columns) {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& column : columns) {
        names.push_back(column.name);
    }
    return names;
}

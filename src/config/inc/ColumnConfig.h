#pragma once

#include <string>
#include <vector>
#include "ColumnType.h"


struct ColumnConfig {
    std::string name;
    std::string type;
    ColumnTypeTag type_tag = ColumnTypeTag::UNKNOWN;

    static ColumnTypeTag get_type_tag(const std::string& type_str);

    ColumnConfig() = default;
    ColumnConfig(const std::string& name, const std::string& type);
    ColumnConfig(const std::string& name, ColumnTypeTag type_tag);

    void calc_type_tag();

    bool is_numeric() const noexcept;

    bool operator==(const ColumnConfig& other) const noexcept {
        return name == other.name && type_tag == other.type_tag;
    }
    bool operator!=(const ColumnConfig& other) const noexcept {
        return !(*this == other);
    }
};

using ColumnConfigVector = std::vector<ColumnConfig>;

std::vector<std::string> column_names(const ColumnConfigVector& columns);

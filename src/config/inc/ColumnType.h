#pragma once

#include <iostream>
#include <variant>
#include <string>
#include <vector>
#include <cstdint>


enum class ColumnTypeTag {
    UNKNOWN,
    BIGINT,       // int64_t
    DOUBLE,       // double
    VARCHAR,      // std::string, stored byte-for-byte
    BIGINT_LIST   // std::vector<int64_t>, produced by list aggregation
};

using BigintList = std::vector<int64_t>;

// std::monostate is the null value
using ColumnType = std::variant<
    std::monostate,
    int64_t,
    double,
    std::string,
    BigintList
>;

using ColumnTypeVector = std::vector<ColumnType>;
using RowType = ColumnTypeVector;


const char* type_tag_name(ColumnTypeTag tag) noexcept;
bool is_numeric_tag(ColumnTypeTag tag) noexcept;

inline bool is_null(const ColumnType& value) noexcept {
    return std::holds_alternative<std::monostate>(value);
}

// Renders a value for diagnostics: null as "null", lists as "[a, b]"
std::string to_display_string(const ColumnType& value);

std::ostream& operator<<(std::ostream& os, const ColumnType& column);
std::ostream& operator<<(std::ostream& os, const RowType& row);

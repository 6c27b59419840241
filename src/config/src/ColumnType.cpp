#include "ColumnType.h"
#include <iomanip>
#include <sstream>
#include <type_traits>


const char* type_tag_name(ColumnTypeTag tag) noexcept {
    switch (tag) {
        case ColumnTypeTag::BIGINT:      return "bigint";
        case ColumnTypeTag::DOUBLE:      return "double";
        case ColumnTypeTag::VARCHAR:     return "varchar";
        case ColumnTypeTag::BIGINT_LIST: return "list<bigint>";
        default:                         return "unknown";
    }
}

bool is_numeric_tag(ColumnTypeTag tag) noexcept {
    return tag == ColumnTypeTag::BIGINT || tag == ColumnTypeTag::DOUBLE;
}

std::string to_display_string(const ColumnType& value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const ColumnType& column) {
    std::visit([&os](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            os << "null";
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(15) << value;
            os << oss.str();
        } else if constexpr (std::is_same_v<T, BigintList>) {
            os << "[";
            for (size_t i = 0; i < value.size(); ++i) {
                if (i > 0) os << ", ";
                os << value[i];
            }
            os << "]";
        } else {
            os << value;
        }
    }, column);
    return os;
}

std::ostream& operator<<(std::ostream& os, const RowType& row) {
    os << "(";
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) os << ", ";
        os << row[i];
    }
    os << ")";
    return os;
}

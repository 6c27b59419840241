#pragma once

#include <string>
#include <string_view>
#include <optional>
#include "ColumnType.h"

namespace CSVUtils {

    // Strict numeric parse of a whole field. Surrounding blanks and a
    // leading '+' are accepted, anything else left over is not.
    std::optional<int64_t> parse_bigint(std::string_view value);
    std::optional<double> parse_double(std::string_view value);

    // Throws std::invalid_argument when the value does not parse as target_type
    ColumnType convert_to_type(const std::string& value, ColumnTypeTag target_type);

}

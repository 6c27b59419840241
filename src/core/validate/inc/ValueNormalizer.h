#pragma once

#include <string>
#include <string_view>
#include "ColumnType.h"
#include "TypeConfig.h"

namespace ValueNormalizer {

    constexpr double RELATIVE_TOLERANCE = 1e-6;

    // Null tokens, blank text and "nan" in any case
    bool is_null_text(std::string_view text, const TypeConfig& type_config);

    // monostate, NaN, blank strings and "nan" strings
    bool is_null_value(const ColumnType& value);

    // Relative tolerance, absolute below magnitude 1
    bool numbers_close(double expected, double actual) noexcept;

    // Two stored values; nulls match each other, doubles within tolerance
    bool same_value(const ColumnType& expected, const ColumnType& actual);

    // Source text against the stored value of a column of the given type
    bool matches(std::string_view source_text, const ColumnType& stored, ColumnTypeTag type,
                 const TypeConfig& type_config);

}

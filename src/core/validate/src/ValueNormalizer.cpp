#include "ValueNormalizer.h"
#include <algorithm>
#include <cmath>
#include "CSVUtils.h"
#include "StringUtils.h"

namespace ValueNormalizer {

    namespace {

        bool is_nan_text(std::string_view text) {
            return StringUtils::to_lower(StringUtils::trim_copy(text)) == "nan";
        }

        std::optional<double> stored_number(const ColumnType& value) {
            if (std::holds_alternative<int64_t>(value)) {
                return static_cast<double>(std::get<int64_t>(value));
            }
            if (std::holds_alternative<double>(value)) {
                return std::get<double>(value);
            }
            return std::nullopt;
        }

    }

    bool is_null_text(std::string_view text, const TypeConfig& type_config) {
        return type_config.is_null_token(text) || StringUtils::is_blank(text) || is_nan_text(text);
    }

    bool is_null_value(const ColumnType& value) {
        if (is_null(value)) {
            return true;
        }
        if (std::holds_alternative<double>(value)) {
            return std::isnan(std::get<double>(value));
        }
        if (std::holds_alternative<std::string>(value)) {
            const auto& text = std::get<std::string>(value);
            return StringUtils::is_blank(text) || is_nan_text(text);
        }
        return false;
    }

    bool numbers_close(double expected, double actual) noexcept {
        if (expected == actual) {
            return true;
        }
        double scale = std::max({1.0, std::fabs(expected), std::fabs(actual)});
        return std::fabs(expected - actual) <= RELATIVE_TOLERANCE * scale;
    }

    bool same_value(const ColumnType& expected, const ColumnType& actual) {
        bool expected_null = is_null_value(expected);
        bool actual_null = is_null_value(actual);
        if (expected_null || actual_null) {
            return expected_null == actual_null;
        }
        auto lhs = stored_number(expected);
        auto rhs = stored_number(actual);
        if (lhs && rhs) {
            return numbers_close(*lhs, *rhs);
        }
        return expected == actual;
    }

    bool matches(std::string_view source_text, const ColumnType& stored, ColumnTypeTag type,
                 const TypeConfig& type_config) {
        bool source_null = is_null_text(source_text, type_config);
        bool stored_null = is_null_value(stored);
        if (source_null || stored_null) {
            return source_null == stored_null;
        }

        if (is_numeric_tag(type)) {
            auto expected = CSVUtils::parse_double(source_text);
            auto actual = stored_number(stored);
            return expected && actual && numbers_close(*expected, *actual);
        }

        if (!std::holds_alternative<std::string>(stored)) {
            return false;
        }
        return StringUtils::trim_copy(source_text) == StringUtils::trim_copy(std::get<std::string>(stored));
    }

}

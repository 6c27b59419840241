#include "CSVUtils.h"
#include <charconv>
#include <stdexcept>
#include <cctype>

namespace CSVUtils {

    namespace {

        std::string_view strip_number(std::string_view value) {
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
                value.remove_prefix(1);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
                value.remove_suffix(1);
            }
            // from_chars rejects an explicit plus sign
            if (value.size() > 1 && value.front() == '+' && value[1] != '-') {
                value.remove_prefix(1);
            }
            return value;
        }

    }

    std::optional<int64_t> parse_bigint(std::string_view value) {
        std::string_view digits = strip_number(value);
        if (digits.empty()) {
            return std::nullopt;
        }

        int64_t result = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), result);
        if (ec != std::errc() || ptr != digits.data() + digits.size()) {
            return std::nullopt;
        }
        return result;
    }

    std::optional<double> parse_double(std::string_view value) {
        std::string_view digits = strip_number(value);
        if (digits.empty()) {
            return std::nullopt;
        }

        double result = 0.0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), result);
        if (ec != std::errc() || ptr != digits.data() + digits.size()) {
            return std::nullopt;
        }
        return result;
    }

    ColumnType convert_to_type(const std::string& value, ColumnTypeTag target_type) {
        switch (target_type) {
            case ColumnTypeTag::BIGINT: {
                auto parsed = parse_bigint(value);
                if (!parsed) {
                    throw std::invalid_argument("invalid integer value");
                }
                return *parsed;
            }
            case ColumnTypeTag::DOUBLE: {
                auto parsed = parse_double(value);
                if (!parsed) {
                    throw std::invalid_argument("invalid float value");
                }
                return *parsed;
            }
            case ColumnTypeTag::VARCHAR:
                // stored byte-for-byte, identifiers keep leading zeros and padding
                return value;
            default:
                throw std::invalid_argument(std::string("cannot convert text to ") + type_tag_name(target_type));
        }
    }

}

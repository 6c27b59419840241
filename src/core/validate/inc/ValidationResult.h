#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>


// Outcome of the three conversion tiers and the values each compared
struct ValidationResult {
    bool row_count_valid = false;
    int64_t row_count_expected = 0;
    int64_t row_count_actual = 0;

    bool checksum_valid = false;
    std::optional<std::string> checksum_column;
    double checksum_expected = 0.0;
    double checksum_actual = 0.0;
    // key column -> (expected, actual) non-null count
    std::map<std::string, std::pair<int64_t, int64_t>> non_null_counts;

    bool sample_valid = false;
    size_t sample_size = 0;

    bool all_valid() const noexcept {
        return row_count_valid && checksum_valid && sample_valid;
    }
};

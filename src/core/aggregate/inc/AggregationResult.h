#pragma once

#include <cstdint>
#include <optional>
#include <string>


struct AggregationValidationResult {
    bool completeness_valid = false;
    int64_t source_distinct_count = 0;
    int64_t output_count = 0;

    bool aggregation_valid = false;
    int64_t aggregation_checks_passed = 0;

    bool sample_valid = false;
    size_t sample_size = 0;

    bool all_valid() const noexcept {
        return completeness_valid && aggregation_valid && sample_valid;
    }
};

struct AggregationResult {
    std::string source_path;
    std::string output_path;
    // Rows that passed the filters
    int64_t source_rows = 0;
    int64_t output_count = 0;
    std::optional<AggregationValidationResult> validation;

    bool is_valid() const noexcept {
        return !validation || validation->all_valid();
    }
};

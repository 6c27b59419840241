#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "StreamingStats.h"
#include "ValidationResult.h"


struct ConversionResult {
    std::string source_path;
    std::string output_path;
    int64_t row_count = 0;
    StreamingStats stats;
    // Empty when validation was switched off
    std::optional<ValidationResult> validation;

    bool is_valid() const noexcept {
        return !validation || validation->all_valid();
    }
};

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "ColumnConfig.h"


struct ChecksumTolerance {
    double absolute = 0.01;
    double relative = 1e-6;

    // max(absolute, relative * |expected|)
    double allowed(double expected) const noexcept;
    bool within(double expected, double actual) const noexcept;
};

// Per-dataset descriptor. Loaded once, never mutated during a run.
struct TypeConfig {
    std::string name;
    ColumnConfigVector columns;
    std::vector<std::string> null_tokens = {"\\N", ""};
    std::vector<std::string> key_columns;
    std::optional<std::string> checksum_column;
    size_t default_sample_size = 1000;
    char delimiter = ',';
    bool has_header = true;
    ChecksumTolerance checksum_tolerance;

    std::vector<std::string> expected_columns() const;
    const ColumnConfig* find_column(const std::string& column_name) const;
    bool is_null_token(std::string_view value) const;

    // Throws ConfigError on an inconsistent descriptor
    void validate() const;
};

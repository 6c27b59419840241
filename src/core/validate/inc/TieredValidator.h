#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "RowSampler.h"
#include "StreamingStats.h"
#include "TypeConfig.h"
#include "ValidationResult.h"


// Three sequential gates over a finished conversion. Each tier throws its
// own error on failure and later tiers are not run.
class TieredValidator {
public:
    explicit TieredValidator(const TypeConfig& type_config, std::optional<uint64_t> seed = std::nullopt);

    TieredValidator(const TieredValidator&) = delete;
    TieredValidator& operator=(const TieredValidator&) = delete;

    virtual ~TieredValidator() = default;

    // Counts the source when expected_rows is not given
    ValidationResult run(const std::string& source_path,
                         const std::string& output_path,
                         const StreamingStats& stats,
                         size_t sample_size,
                         std::optional<int64_t> expected_rows = std::nullopt);

    // Tier 1, file metadata only
    virtual void validate_row_count(int64_t expected, const std::string& output_path,
                                    const StreamingStats& stats, ValidationResult& result);

    // Tier 2, reads the checksum and key columns
    virtual void validate_checksums(const std::string& output_path, const StreamingStats& stats,
                                    ValidationResult& result);

    // Tier 3, field-level comparison of sampled rows
    virtual void validate_sample(const std::string& source_path, const std::string& output_path,
                                 size_t sample_size, ValidationResult& result);

protected:
    TypeConfig type_config_;
    RowSampler sampler_;
};

#pragma once

#include <optional>
#include <string>
#include "ConversionResult.h"
#include "ConvertOptions.h"
#include "TypeConfig.h"


// Entry point for one dataset: pre-flight count, streaming conversion,
// schema check and the tiered validation.
class DatasetConverter {
public:
    DatasetConverter(const TypeConfig& type_config, const ConvertOptions& options);

    ConversionResult convert(const std::string& source_path, const std::string& output_path);

    // Runs the three tiers against an existing output. The row count is
    // established again from the source.
    ValidationResult validate(const std::string& source_path,
                              const std::string& output_path,
                              const StreamingStats& stats,
                              std::optional<size_t> sample_size = std::nullopt);

    const TypeConfig& type_config() const noexcept { return type_config_; }
    const ConvertOptions& options() const noexcept { return options_; }

private:
    size_t effective_sample_size(std::optional<size_t> sample_size) const noexcept;

    TypeConfig type_config_;
    ConvertOptions options_;
};

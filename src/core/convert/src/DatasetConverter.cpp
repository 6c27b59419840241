#include "DatasetConverter.h"
#include "LogUtils.h"
#include "RowCounter.h"
#include "SchemaValidator.h"
#include "StreamingConverter.h"
#include "TieredValidator.h"


DatasetConverter::DatasetConverter(const TypeConfig& type_config, const ConvertOptions& options)
    : type_config_(type_config), options_(options) {}

size_t DatasetConverter::effective_sample_size(std::optional<size_t> sample_size) const noexcept {
    if (sample_size) {
        return *sample_size;
    }
    return options_.sample_size.value_or(type_config_.default_sample_size);
}

ConversionResult DatasetConverter::convert(const std::string& source_path, const std::string& output_path) {
    ConversionResult result;
    result.source_path = source_path;
    result.output_path = output_path;

    std::optional<int64_t> expected_rows;
    if (options_.validate) {
        expected_rows = RowCounter(type_config_.has_header, type_config_.delimiter).count(source_path);
        infoPrint("Pre-flight count of %s: %ld rows\n", source_path.c_str(), static_cast<long>(*expected_rows));
    }

    StreamingConverter converter(type_config_, options_);
    result.stats = converter.convert(source_path, output_path);
    result.row_count = result.stats.row_count;

    SchemaValidator::validate(result.stats.observed_schema, type_config_, source_path);

    if (options_.validate) {
        TieredValidator validator(type_config_, options_.seed);
        result.validation = validator.run(source_path, output_path, result.stats,
                                          effective_sample_size(std::nullopt), expected_rows);
    } else {
        warnPrint("Validation disabled for %s, output is unverified\n", output_path.c_str());
    }
    return result;
}

ValidationResult DatasetConverter::validate(const std::string& source_path,
                                            const std::string& output_path,
                                            const StreamingStats& stats,
                                            std::optional<size_t> sample_size) {
    SchemaValidator::validate(stats.observed_schema, type_config_, source_path);
    TieredValidator validator(type_config_, options_.seed);
    return validator.run(source_path, output_path, stats, effective_sample_size(sample_size));
}

#include "TieredValidator.h"
#include <cmath>
#include <limits>
#include <unordered_map>
#include "CSVReader.h"
#include "ColumnarReader.h"
#include "ConvertError.h"
#include "LogUtils.h"
#include "RowCounter.h"
#include "ValueNormalizer.h"


TieredValidator::TieredValidator(const TypeConfig& type_config, std::optional<uint64_t> seed)
    : type_config_(type_config), sampler_(seed) {}

ValidationResult TieredValidator::run(const std::string& source_path,
                                      const std::string& output_path,
                                      const StreamingStats& stats,
                                      size_t sample_size,
                                      std::optional<int64_t> expected_rows) {
    ValidationResult result;

    int64_t expected = expected_rows ? *expected_rows
                                     : RowCounter(type_config_.has_header, type_config_.delimiter).count(source_path);

    validate_row_count(expected, output_path, stats, result);
    infoPrint("Tier 1 passed: %ld rows\n", static_cast<long>(result.row_count_actual));

    validate_checksums(output_path, stats, result);
    infoPrint("Tier 2 passed: checksums match\n");

    validate_sample(source_path, output_path, sample_size, result);
    infoPrint("Tier 3 passed: %zu sampled rows match\n", result.sample_size);

    return result;
}

void TieredValidator::validate_row_count(int64_t expected, const std::string& output_path,
                                         const StreamingStats& stats, ValidationResult& result) {
    ColumnarReader reader(output_path);
    result.row_count_expected = expected;
    result.row_count_actual = static_cast<int64_t>(reader.num_rows());

    if (result.row_count_actual != expected) {
        throw RowCountMismatchError(expected, result.row_count_actual, output_path);
    }
    if (stats.row_count != expected) {
        throw RowCountMismatchError(expected, stats.row_count, output_path);
    }
    result.row_count_valid = true;
}

void TieredValidator::validate_checksums(const std::string& output_path, const StreamingStats& stats,
                                         ValidationResult& result) {
    ColumnarReader reader(output_path);
    const double missing = std::numeric_limits<double>::quiet_NaN();

    std::vector<size_t> projection;
    std::optional<size_t> checksum_slot;
    if (type_config_.checksum_column) {
        const std::string& name = *type_config_.checksum_column;
        result.checksum_column = name;
        result.checksum_expected = stats.checksum_sum;
        auto index = reader.column_index(name);
        if (!index) {
            throw ChecksumMismatchError(name, stats.checksum_sum, missing, output_path, "column missing from output");
        }
        checksum_slot = projection.size();
        projection.push_back(*index);
    }

    std::vector<int64_t> key_counts(type_config_.key_columns.size(), 0);
    std::vector<size_t> key_slots;
    for (const auto& key : type_config_.key_columns) {
        auto index = reader.column_index(key);
        auto expected = stats.non_null_counts.find(key);
        int64_t expected_count = expected == stats.non_null_counts.end() ? 0 : expected->second;
        if (!index) {
            throw ChecksumMismatchError(key, static_cast<double>(expected_count), missing, output_path,
                                        "key column missing from output");
        }
        key_slots.push_back(projection.size());
        projection.push_back(*index);
    }

    double sum = 0.0;
    for (size_t rg = 0; rg < reader.num_row_groups() && !projection.empty(); ++rg) {
        ColumnBatch batch = reader.read_row_group(rg, projection);
        if (checksum_slot) {
            const ColumnVector& column = batch.column(*checksum_slot);
            for (size_t i = 0; i < column.size(); ++i) {
                if (auto value = column.finite_at(i)) {
                    sum += *value;
                }
            }
        }
        for (size_t k = 0; k < key_slots.size(); ++k) {
            const ColumnVector& column = batch.column(key_slots[k]);
            key_counts[k] += static_cast<int64_t>(column.size() - column.null_count());
        }
    }

    for (size_t k = 0; k < type_config_.key_columns.size(); ++k) {
        const std::string& key = type_config_.key_columns[k];
        auto expected = stats.non_null_counts.find(key);
        int64_t expected_count = expected == stats.non_null_counts.end() ? 0 : expected->second;
        result.non_null_counts[key] = {expected_count, key_counts[k]};
        if (expected_count != key_counts[k]) {
            throw ChecksumMismatchError(key, static_cast<double>(expected_count),
                                        static_cast<double>(key_counts[k]), output_path, "non-null count");
        }
    }

    if (checksum_slot) {
        result.checksum_actual = sum;
        if (!type_config_.checksum_tolerance.within(stats.checksum_sum, sum)) {
            throw ChecksumMismatchError(*type_config_.checksum_column, stats.checksum_sum, sum, output_path, "sum");
        }
    }
    result.checksum_valid = true;
}

void TieredValidator::validate_sample(const std::string& source_path, const std::string& output_path,
                                      size_t sample_size, ValidationResult& result) {
    ColumnarReader reader(output_path);
    const int64_t total = static_cast<int64_t>(reader.num_rows());
    std::vector<int64_t> targets = sampler_.sample(total, sample_size);
    result.sample_size = targets.size();
    if (targets.empty()) {
        result.sample_valid = true;
        return;
    }
    debugPrint("Sampling %zu of %ld rows, seed %lu\n",
               targets.size(), static_cast<long>(total), static_cast<unsigned long>(sampler_.seed()));

    // source pass
    CSVReader csv(source_path, type_config_.has_header, type_config_.delimiter);
    const CSVRow source_columns = type_config_.has_header ? csv.header() : CSVRow(type_config_.expected_columns());
    std::vector<CSVRecord> source_rows;
    source_rows.reserve(targets.size());
    int64_t position = 0;
    while (source_rows.size() < targets.size()) {
        auto record = csv.read_next();
        if (!record) {
            throw RowCountMismatchError(total, position, source_path);
        }
        if (position == targets[source_rows.size()]) {
            source_rows.push_back(std::move(*record));
        }
        ++position;
    }

    std::vector<RowType> output_rows = reader.read_rows(targets);

    std::unordered_map<std::string, size_t> source_index;
    for (size_t i = 0; i < source_columns.size(); ++i) {
        source_index.emplace(source_columns[i], i);
    }
    std::optional<size_t> key_field;
    if (!type_config_.key_columns.empty()) {
        auto it = source_index.find(type_config_.key_columns.front());
        if (it != source_index.end()) {
            key_field = it->second;
        }
    }

    const ColumnConfigVector& schema = reader.schema();
    for (size_t s = 0; s < targets.size(); ++s) {
        const CSVRecord& source_row = source_rows[s];
        const RowType& output_row = output_rows.at(s);
        std::optional<std::string> key;
        if (key_field && *key_field < source_row.fields.size()) {
            key = source_row.fields[*key_field];
        }

        for (size_t c = 0; c < schema.size(); ++c) {
            auto field = source_index.find(schema[c].name);
            if (field == source_index.end() || field->second >= source_row.fields.size()) {
                throw SampleMismatchError(targets[s], schema[c].name, "<absent>",
                                          to_display_string(output_row[c]), key, output_path);
            }
            const std::string& expected = source_row.fields[field->second];
            if (!ValueNormalizer::matches(expected, output_row[c], schema[c].type_tag, type_config_)) {
                throw SampleMismatchError(targets[s], schema[c].name, expected,
                                          to_display_string(output_row[c]), key, output_path);
            }
        }
    }
    result.sample_valid = true;
}

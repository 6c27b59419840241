#include "AggregationValidator.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include "AggregationSource.h"
#include "ColumnarReader.h"
#include "ConvertError.h"
#include "LogUtils.h"
#include "ValueNormalizer.h"


namespace {

    std::vector<std::string> display_keys(const std::vector<ColumnType>& keys) {
        std::vector<std::string> shown;
        for (const auto& key : keys) {
            if (shown.size() == CompletenessError::MAX_EXAMPLES) {
                break;
            }
            shown.push_back(to_display_string(key));
        }
        return shown;
    }

}

AggregationValidator::AggregationValidator(const AggregationConfig& config, std::optional<uint64_t> seed)
    : config_(config), sampler_(seed) {}

AggregationValidationResult AggregationValidator::run(const std::string& source_path, const std::string& output_path) {
    AggregationValidationResult result;

    validate_completeness(source_path, output_path, result);
    infoPrint("Tier 1 passed: %ld keys present exactly once\n", static_cast<long>(result.output_count));

    validate_integrity(source_path, output_path, result);
    infoPrint("Tier 2 passed: %ld aggregate checks\n", static_cast<long>(result.aggregation_checks_passed));

    validate_sample(source_path, output_path, result);
    infoPrint("Tier 3 passed: %zu sampled groups match\n", result.sample_size);

    return result;
}

void AggregationValidator::validate_completeness(const std::string& source_path, const std::string& output_path,
                                                 AggregationValidationResult& result) {
    std::set<ColumnType> source_keys;
    {
        AggregationSource source(source_path, config_);
        for (size_t rg = 0; rg < source.num_row_groups(); ++rg) {
            ColumnBatch batch = source.read_row_group(rg);
            const ColumnVector& keys = batch.column(source.key_slot());
            for (size_t row = 0; row < batch.num_rows(); ++row) {
                if (source.accepts(batch, row)) {
                    source_keys.insert(keys.get(row));
                }
            }
        }
    }

    ColumnarReader output(output_path);
    auto key_index = output.column_index(config_.group_key);
    if (!key_index) {
        throw SchemaValidationError(config_.output_columns(), column_names(output.schema()), output_path,
                                    "aggregation output lacks the group key");
    }

    std::set<ColumnType> output_keys;
    std::set<ColumnType> duplicate_keys;
    for (size_t rg = 0; rg < output.num_row_groups(); ++rg) {
        ColumnVector keys = output.read_column(rg, *key_index);
        for (size_t row = 0; row < keys.size(); ++row) {
            ColumnType key = keys.get(row);
            if (!output_keys.insert(key).second) {
                duplicate_keys.insert(std::move(key));
            }
        }
    }

    std::vector<ColumnType> missing;
    std::vector<ColumnType> extra;
    std::set_difference(source_keys.begin(), source_keys.end(), output_keys.begin(), output_keys.end(),
                        std::back_inserter(missing));
    std::set_difference(output_keys.begin(), output_keys.end(), source_keys.begin(), source_keys.end(),
                        std::back_inserter(extra));

    result.source_distinct_count = static_cast<int64_t>(source_keys.size());
    result.output_count = static_cast<int64_t>(output.num_rows());

    if (!missing.empty() || !extra.empty() || !duplicate_keys.empty()) {
        std::vector<ColumnType> duplicates(duplicate_keys.begin(), duplicate_keys.end());
        throw CompletenessError(result.source_distinct_count, result.output_count,
                                display_keys(missing), display_keys(extra), display_keys(duplicates), output_path);
    }
    result.completeness_valid = true;
}

AggregationValidator::SourceGroups AggregationValidator::collect_groups(const std::string& source_path,
                                                                        const std::set<ColumnType>& keys) const {
    SourceGroups groups;
    AggregationSource source(source_path, config_);

    std::vector<std::optional<size_t>> slots;
    for (const auto& field : config_.fields) {
        if (field.reduce == ReduceKind::COUNT) {
            slots.emplace_back(std::nullopt);
        } else {
            slots.emplace_back(source.slot(field.source));
        }
    }

    for (size_t rg = 0; rg < source.num_row_groups(); ++rg) {
        ColumnBatch batch = source.read_row_group(rg);
        const ColumnVector& key_column = batch.column(source.key_slot());
        const ColumnVector& order_column = batch.column(source.order_slot());
        for (size_t row = 0; row < batch.num_rows(); ++row) {
            if (!source.accepts(batch, row)) {
                continue;
            }
            ColumnType key = key_column.get(row);
            if (keys.count(key) == 0) {
                continue;
            }
            SourceRow source_row;
            source_row.order = order_column.get(row);
            for (const auto& slot : slots) {
                source_row.values.push_back(slot ? batch.column(*slot).get(row) : ColumnType{});
            }
            groups[key].push_back(std::move(source_row));
        }
    }
    return groups;
}

std::vector<RowType> AggregationValidator::sample_output(const std::string& output_path, size_t count,
                                                         std::vector<int64_t>& positions) {
    ColumnarReader output(output_path);
    positions = sampler_.sample(static_cast<int64_t>(output.num_rows()), count);
    return output.read_rows(positions);
}

void AggregationValidator::validate_integrity(const std::string& source_path, const std::string& output_path,
                                              AggregationValidationResult& result) {
    std::vector<int64_t> positions;
    std::vector<RowType> rows = sample_output(output_path, config_.aggregation_sample_size, positions);

    std::set<ColumnType> keys;
    for (const auto& row : rows) {
        keys.insert(row.front());
    }
    SourceGroups groups = collect_groups(source_path, keys);

    int64_t passed = 0;
    for (const auto& row : rows) {
        const ColumnType& key = row.front();
        const std::vector<SourceRow>& members = groups[key];

        for (size_t f = 0; f < config_.fields.size(); ++f) {
            const FieldConfig& field = config_.fields[f];
            const ColumnType& actual = row[f + 1];
            ColumnType expected;

            switch (field.reduce) {
                case ReduceKind::COUNT:
                    expected = static_cast<int64_t>(members.size());
                    break;
                case ReduceKind::MIN:
                case ReduceKind::MAX: {
                    std::vector<ColumnType> values;
                    for (const auto& member : members) {
                        const ColumnType& value = member.values[f];
                        bool nan = std::holds_alternative<double>(value) && std::isnan(std::get<double>(value));
                        if (!is_null(value) && !nan) {
                            values.push_back(value);
                        }
                    }
                    if (!values.empty()) {
                        expected = field.reduce == ReduceKind::MIN ? *std::min_element(values.begin(), values.end())
                                                                   : *std::max_element(values.begin(), values.end());
                    }
                    break;
                }
                case ReduceKind::LIST: {
                    int64_t length = std::count_if(members.begin(), members.end(),
                                                   [f](const SourceRow& m) { return !is_null(m.values[f]); });
                    int64_t actual_length = std::holds_alternative<BigintList>(actual)
                                            ? static_cast<int64_t>(std::get<BigintList>(actual).size()) : -1;
                    if (length != actual_length) {
                        throw AggregationError(to_display_string(key), field.name + " (length)",
                                               std::to_string(length), std::to_string(actual_length), output_path);
                    }
                    ++passed;
                    continue;
                }
                default:
                    continue;
            }

            if (!ValueNormalizer::same_value(expected, actual)) {
                throw AggregationError(to_display_string(key), field.name,
                                       to_display_string(expected), to_display_string(actual), output_path);
            }
            ++passed;
        }
    }

    result.aggregation_checks_passed = passed;
    result.aggregation_valid = true;
}

void AggregationValidator::validate_sample(const std::string& source_path, const std::string& output_path,
                                           AggregationValidationResult& result) {
    std::vector<int64_t> positions;
    std::vector<RowType> rows = sample_output(output_path, config_.deep_sample_size, positions);
    result.sample_size = rows.size();

    std::set<ColumnType> keys;
    for (const auto& row : rows) {
        keys.insert(row.front());
    }
    SourceGroups groups = collect_groups(source_path, keys);

    for (size_t s = 0; s < rows.size(); ++s) {
        const RowType& row = rows[s];
        const ColumnType& key = row.front();
        std::vector<SourceRow> members = groups[key];
        // source order is kept for equal ordering values
        std::stable_sort(members.begin(), members.end(),
                         [](const SourceRow& a, const SourceRow& b) { return a.order < b.order; });

        for (size_t f = 0; f < config_.fields.size(); ++f) {
            const FieldConfig& field = config_.fields[f];
            const ColumnType& actual = row[f + 1];
            ColumnType expected;

            switch (field.reduce) {
                case ReduceKind::LIST: {
                    BigintList list;
                    for (const auto& member : members) {
                        if (!is_null(member.values[f])) {
                            list.push_back(std::get<int64_t>(member.values[f]));
                        }
                    }
                    expected = std::move(list);
                    if (expected != actual) {
                        throw SampleMismatchError(static_cast<int64_t>(s), field.name, to_display_string(expected),
                                                  to_display_string(actual), to_display_string(key), output_path);
                    }
                    continue;
                }
                case ReduceKind::LAST:
                    if (!members.empty()) {
                        expected = members.back().values[f];
                    }
                    break;
                case ReduceKind::FIRST:
                    if (!members.empty()) {
                        expected = members.front().values[f];
                    }
                    break;
                default:
                    continue;
            }

            if (!ValueNormalizer::same_value(expected, actual)) {
                throw SampleMismatchError(static_cast<int64_t>(s), field.name, to_display_string(expected),
                                          to_display_string(actual), to_display_string(key), output_path);
            }
        }
    }
    result.sample_valid = true;
}

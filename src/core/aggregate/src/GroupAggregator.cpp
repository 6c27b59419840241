#include "GroupAggregator.h"
#include <algorithm>
#include <cmath>
#include "AggregationValidator.h"
#include "ColumnarWriter.h"
#include "ConvertError.h"
#include "LogUtils.h"


namespace {

    bool is_missing(const ColumnType& value) {
        if (is_null(value)) {
            return true;
        }
        return std::holds_alternative<double>(value) && std::isnan(std::get<double>(value));
    }

}

GroupAggregator::GroupAggregator(const AggregationConfig& config, const ConvertOptions& options)
    : config_(config), options_(options) {
    if (options_.batch_size == 0) {
        throw std::invalid_argument("batch_size must be positive");
    }
}

ColumnConfigVector GroupAggregator::output_schema(const AggregationConfig& config,
                                                  const ColumnConfigVector& source_schema) {
    auto type_of = [&source_schema](const std::string& name) {
        for (const auto& column : source_schema) {
            if (column.name == name) {
                return column.type_tag;
            }
        }
        return ColumnTypeTag::UNKNOWN;
    };

    ColumnConfigVector schema;
    schema.emplace_back(config.group_key, type_of(config.group_key));
    for (const auto& field : config.fields) {
        schema.emplace_back(field.name, field.output_type(type_of(field.source)));
    }
    return schema;
}

void GroupAggregator::update(GroupState& state, const ColumnBatch& batch, size_t row) const {
    ++state.count;
    const ColumnType order = batch.column(order_slot_).get(row);

    for (size_t f = 0; f < config_.fields.size(); ++f) {
        const FieldConfig& field = config_.fields[f];
        FieldState& acc = state.fields[f];
        if (!field_slots_[f]) {
            continue;
        }
        const ColumnVector& column = batch.column(*field_slots_[f]);

        switch (field.reduce) {
            case ReduceKind::MIN:
            case ReduceKind::MAX: {
                ColumnType value = column.get(row);
                if (is_missing(value)) {
                    break;
                }
                bool better = !acc.seen ||
                              (field.reduce == ReduceKind::MIN ? value < acc.value : acc.value < value);
                if (better) {
                    acc.value = std::move(value);
                    acc.seen = true;
                }
                break;
            }
            case ReduceKind::LAST:
                // ties go to the later row
                if (!acc.seen || !(order < acc.order)) {
                    acc.value = column.get(row);
                    acc.order = order;
                    acc.seen = true;
                }
                break;
            case ReduceKind::FIRST:
                if (!acc.seen || order < acc.order) {
                    acc.value = column.get(row);
                    acc.order = order;
                    acc.seen = true;
                }
                break;
            case ReduceKind::LIST:
                if (!column.is_null(row)) {
                    acc.items.emplace_back(order, column.bigint_at(row));
                }
                break;
            case ReduceKind::COUNT:
                break;
        }
    }
}

RowType GroupAggregator::finalize(const ColumnType& key, GroupState& state) const {
    RowType row;
    row.reserve(config_.fields.size() + 1);
    row.push_back(key);

    for (size_t f = 0; f < config_.fields.size(); ++f) {
        FieldState& acc = state.fields[f];
        switch (config_.fields[f].reduce) {
            case ReduceKind::COUNT:
                row.emplace_back(state.count);
                break;
            case ReduceKind::LIST: {
                std::stable_sort(acc.items.begin(), acc.items.end(),
                                 [](const auto& a, const auto& b) { return a.first < b.first; });
                BigintList list;
                list.reserve(acc.items.size());
                for (const auto& item : acc.items) {
                    list.push_back(item.second);
                }
                row.emplace_back(std::move(list));
                break;
            }
            default:
                row.push_back(acc.seen ? std::move(acc.value) : ColumnType{});
                break;
        }
    }
    return row;
}

AggregationResult GroupAggregator::aggregate(const std::string& source_path, const std::string& output_path) {
    AggregationResult result;
    result.source_path = source_path;
    result.output_path = output_path;

    std::map<ColumnType, GroupState> groups;
    ColumnConfigVector schema;
    {
        AggregationSource source(source_path, config_);
        order_slot_ = source.order_slot();
        field_slots_.clear();
        for (const auto& field : config_.fields) {
            if (field.reduce == ReduceKind::COUNT) {
                field_slots_.emplace_back(std::nullopt);
            } else {
                field_slots_.emplace_back(source.slot(field.source));
            }
        }
        schema = output_schema(config_, source.schema());

        for (size_t rg = 0; rg < source.num_row_groups(); ++rg) {
            ColumnBatch batch = source.read_row_group(rg);
            const ColumnVector& keys = batch.column(source.key_slot());
            for (size_t row = 0; row < batch.num_rows(); ++row) {
                if (!source.accepts(batch, row)) {
                    continue;
                }
                auto [it, inserted] = groups.try_emplace(keys.get(row));
                if (inserted) {
                    it->second.fields.resize(config_.fields.size());
                }
                update(it->second, batch, row);
                ++result.source_rows;
            }
            debugPrint("Aggregated row group %zu of %zu, %zu groups so far\n",
                       rg + 1, source.num_row_groups(), groups.size());
        }
    }

    ColumnarWriter writer(output_path, schema, options_.compression_level);
    ColumnBatch batch(schema);
    for (auto& [key, state] : groups) {
        batch.append_row(finalize(key, state));
        if (batch.num_rows() >= options_.batch_size) {
            writer.write_batch(batch);
            batch.clear();
        }
    }
    writer.write_batch(batch);
    writer.set_metadata("pfconvert.aggregation", config_.name);
    writer.set_metadata("pfconvert.source", source_path);
    writer.set_metadata("pfconvert.group_key", config_.group_key);
    writer.close();

    result.output_count = static_cast<int64_t>(groups.size());
    infoPrint("%s: %ld source rows aggregated into %ld groups\n", config_.name.c_str(),
              static_cast<long>(result.source_rows), static_cast<long>(result.output_count));

    if (options_.validate) {
        AggregationValidator validator(config_, options_.seed);
        result.validation = validator.run(source_path, output_path);
    } else {
        warnPrint("Validation disabled for %s, output is unverified\n", output_path.c_str());
    }
    return result;
}

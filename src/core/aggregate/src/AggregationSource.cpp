#include "AggregationSource.h"
#include <cmath>
#include "CSVUtils.h"
#include "ConfigError.h"
#include "ConvertError.h"


namespace {

    // NaN has no place in an ordering, so it counts as null
    bool is_missing(const ColumnVector& column, size_t row) {
        if (column.is_null(row)) {
            return true;
        }
        return column.type() == ColumnTypeTag::DOUBLE && std::isnan(column.double_at(row));
    }

}

AggregationSource::AggregationSource(const std::string& path, const AggregationConfig& config)
    : reader_(path) {
    std::vector<std::string> required = config.required_columns();
    std::vector<std::string> absent;
    for (const auto& name : required) {
        auto index = reader_.column_index(name);
        if (!index) {
            absent.push_back(name);
            continue;
        }
        projection_.push_back(*index);
        schema_.push_back(reader_.schema()[*index]);
    }
    if (!absent.empty()) {
        throw SchemaValidationError(required, column_names(reader_.schema()), path,
                                    "aggregation source lacks required columns");
    }

    key_slot_ = slot(config.group_key);
    order_slot_ = slot(config.order_column);
    if (schema_[key_slot_].type_tag == ColumnTypeTag::BIGINT_LIST) {
        throw ConfigError("Group key '" + config.group_key + "' cannot be a list column", "group_key");
    }
    if (schema_[order_slot_].type_tag == ColumnTypeTag::BIGINT_LIST) {
        throw ConfigError("Order column '" + config.order_column + "' cannot be a list column", "order_column");
    }

    for (size_t i = 0; i < config.fields.size(); ++i) {
        const auto& field = config.fields[i];
        if (field.reduce == ReduceKind::LIST && schema_[slot(field.source)].type_tag != ColumnTypeTag::BIGINT) {
            throw ConfigError("List field '" + field.name + "' needs an integer source column",
                              "fields[" + std::to_string(i) + "].source");
        }
    }

    for (size_t i = 0; i < config.filters.size(); ++i) {
        const auto& filter = config.filters[i];
        BoundFilter bound{slot(filter.column), filter.op, false, 0.0, filter.value};
        ColumnTypeTag type = schema_[bound.slot].type_tag;
        if (type == ColumnTypeTag::BIGINT_LIST) {
            throw ConfigError("Cannot filter on list column '" + filter.column + "'",
                              "filters[" + std::to_string(i) + "].column");
        }
        if (filter.op != FilterOp::NOT_NULL && is_numeric_tag(type)) {
            auto number = CSVUtils::parse_double(filter.value);
            if (!number) {
                throw ConfigError("Filter value '" + filter.value + "' is not numeric",
                                  "filters[" + std::to_string(i) + "].value");
            }
            bound.numeric = true;
            bound.number = *number;
        }
        filters_.push_back(std::move(bound));
    }
}

size_t AggregationSource::slot(const std::string& column) const {
    for (size_t i = 0; i < schema_.size(); ++i) {
        if (schema_[i].name == column) {
            return i;
        }
    }
    throw std::out_of_range("Column '" + column + "' is not part of the projection");
}

ColumnBatch AggregationSource::read_row_group(size_t row_group) {
    return reader_.read_row_group(row_group, projection_);
}

bool AggregationSource::compare(FilterOp op, int cmp) noexcept {
    switch (op) {
        case FilterOp::GE: return cmp >= 0;
        case FilterOp::GT: return cmp > 0;
        case FilterOp::LE: return cmp <= 0;
        case FilterOp::LT: return cmp < 0;
        case FilterOp::EQ: return cmp == 0;
        case FilterOp::NE: return cmp != 0;
        case FilterOp::NOT_NULL: return true;
    }
    return false;
}

bool AggregationSource::passes(const BoundFilter& filter, const ColumnBatch& batch, size_t row) const {
    const ColumnVector& column = batch.column(filter.slot);
    if (is_missing(column, row)) {
        return false;
    }
    if (filter.op == FilterOp::NOT_NULL) {
        return true;
    }
    if (filter.numeric) {
        double value = *column.numeric_at(row);
        int cmp = value < filter.number ? -1 : (value > filter.number ? 1 : 0);
        return compare(filter.op, cmp);
    }
    return compare(filter.op, column.string_at(row).compare(filter.text));
}

bool AggregationSource::accepts(const ColumnBatch& batch, size_t row) const {
    if (is_missing(batch.column(key_slot_), row) || is_missing(batch.column(order_slot_), row)) {
        return false;
    }
    for (const auto& filter : filters_) {
        if (!passes(filter, batch, row)) {
            return false;
        }
    }
    return true;
}

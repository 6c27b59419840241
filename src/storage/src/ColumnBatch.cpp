#include "ColumnBatch.h"
#include <cmath>
#include <stdexcept>
#include <type_traits>


namespace {

    std::invalid_argument type_mismatch(ColumnTypeTag expected, const ColumnType& value) {
        return std::invalid_argument(std::string("Value ") + to_display_string(value) +
                                     " does not match column type " + type_tag_name(expected));
    }

}

void ColumnVector::append(const ColumnType& value) {
    ColumnType copy = value;
    append(std::move(copy));
}

void ColumnVector::append(ColumnType&& value) {
    if (::is_null(value)) {
        append_null();
        return;
    }

    switch (type_) {
        case ColumnTypeTag::BIGINT:
            if (!std::holds_alternative<int64_t>(value)) throw type_mismatch(type_, value);
            bigints_.push_back(std::get<int64_t>(value));
            break;
        case ColumnTypeTag::DOUBLE:
            if (!std::holds_alternative<double>(value)) throw type_mismatch(type_, value);
            doubles_.push_back(std::get<double>(value));
            break;
        case ColumnTypeTag::VARCHAR:
            if (!std::holds_alternative<std::string>(value)) throw type_mismatch(type_, value);
            strings_.push_back(std::move(std::get<std::string>(value)));
            break;
        case ColumnTypeTag::BIGINT_LIST:
            if (!std::holds_alternative<BigintList>(value)) throw type_mismatch(type_, value);
            lists_.push_back(std::move(std::get<BigintList>(value)));
            break;
        default:
            throw type_mismatch(type_, value);
    }
    validity_.push_back(1);
}

void ColumnVector::append_null() {
    switch (type_) {
        case ColumnTypeTag::BIGINT:      bigints_.push_back(0); break;
        case ColumnTypeTag::DOUBLE:      doubles_.push_back(0.0); break;
        case ColumnTypeTag::VARCHAR:     strings_.emplace_back(); break;
        case ColumnTypeTag::BIGINT_LIST: lists_.emplace_back(); break;
        default:
            throw std::invalid_argument("Column has no type");
    }
    validity_.push_back(0);
    ++null_count_;
}

ColumnType ColumnVector::get(size_t index) const {
    if (is_null(index)) {
        return std::monostate{};
    }
    switch (type_) {
        case ColumnTypeTag::BIGINT:      return bigints_[index];
        case ColumnTypeTag::DOUBLE:      return doubles_[index];
        case ColumnTypeTag::VARCHAR:     return strings_[index];
        case ColumnTypeTag::BIGINT_LIST: return lists_[index];
        default:                         return std::monostate{};
    }
}

std::optional<double> ColumnVector::numeric_at(size_t index) const {
    if (is_null(index)) {
        return std::nullopt;
    }
    switch (type_) {
        case ColumnTypeTag::BIGINT: return static_cast<double>(bigints_[index]);
        case ColumnTypeTag::DOUBLE: return doubles_[index];
        default:                    return std::nullopt;
    }
}

std::optional<double> ColumnVector::finite_at(size_t index) const {
    auto value = numeric_at(index);
    if (value && !std::isfinite(*value)) {
        return std::nullopt;
    }
    return value;
}

void ColumnVector::reserve(size_t rows) {
    validity_.reserve(rows);
    switch (type_) {
        case ColumnTypeTag::BIGINT:      bigints_.reserve(rows); break;
        case ColumnTypeTag::DOUBLE:      doubles_.reserve(rows); break;
        case ColumnTypeTag::VARCHAR:     strings_.reserve(rows); break;
        case ColumnTypeTag::BIGINT_LIST: lists_.reserve(rows); break;
        default: break;
    }
}

void ColumnVector::clear() noexcept {
    validity_.clear();
    bigints_.clear();
    doubles_.clear();
    strings_.clear();
    lists_.clear();
    null_count_ = 0;
}


ColumnBatch::ColumnBatch(ColumnConfigVector schema) : schema_(std::move(schema)) {
    columns_.reserve(schema_.size());
    for (const auto& column : schema_) {
        columns_.emplace_back(column.type_tag);
    }
}

std::optional<size_t> ColumnBatch::column_index(const std::string& name) const {
    for (size_t i = 0; i < schema_.size(); ++i) {
        if (schema_[i].name == name) {
            return i;
        }
    }
    return std::nullopt;
}

void ColumnBatch::append_row(RowType&& row) {
    if (row.size() != columns_.size()) {
        throw std::invalid_argument("Row has " + std::to_string(row.size()) +
                                    " values, batch has " + std::to_string(columns_.size()) + " columns");
    }
    for (size_t i = 0; i < row.size(); ++i) {
        columns_[i].append(std::move(row[i]));
    }
    ++num_rows_;
}

void ColumnBatch::set_column(size_t index, ColumnVector&& column) {
    if (column.type() != schema_.at(index).type_tag) {
        throw std::invalid_argument("Column '" + schema_[index].name + "' type mismatch");
    }
    columns_[index] = std::move(column);
    num_rows_ = columns_[index].size();
}

RowType ColumnBatch::row(size_t index) const {
    RowType values;
    values.reserve(columns_.size());
    for (const auto& column : columns_) {
        values.push_back(column.get(index));
    }
    return values;
}

void ColumnBatch::reserve(size_t rows) {
    for (auto& column : columns_) {
        column.reserve(rows);
    }
}

void ColumnBatch::clear() noexcept {
    for (auto& column : columns_) {
        column.clear();
    }
    num_rows_ = 0;
}

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "ColumnConfig.h"


// Typed values of one column. Only the vector matching the type is used.
class ColumnVector {
public:
    explicit ColumnVector(ColumnTypeTag type = ColumnTypeTag::UNKNOWN) : type_(type) {}

    ColumnTypeTag type() const noexcept { return type_; }
    size_t size() const noexcept { return validity_.size(); }
    size_t null_count() const noexcept { return null_count_; }
    bool is_null(size_t index) const { return validity_.at(index) == 0; }

    // Throws std::invalid_argument when the value does not match type()
    void append(const ColumnType& value);
    void append(ColumnType&& value);
    void append_null();

    ColumnType get(size_t index) const;

    int64_t bigint_at(size_t index) const { return bigints_.at(index); }
    double double_at(size_t index) const { return doubles_.at(index); }
    const std::string& string_at(size_t index) const { return strings_.at(index); }
    const BigintList& list_at(size_t index) const { return lists_.at(index); }

    // Numeric value as double, nullopt for null or non-numeric columns
    std::optional<double> numeric_at(size_t index) const;
    // As numeric_at, also nullopt for NaN and infinities
    std::optional<double> finite_at(size_t index) const;

    void reserve(size_t rows);
    void clear() noexcept;

private:
    ColumnTypeTag type_;
    std::vector<uint8_t> validity_;
    std::vector<int64_t> bigints_;
    std::vector<double> doubles_;
    std::vector<std::string> strings_;
    std::vector<BigintList> lists_;
    size_t null_count_ = 0;
};


// A bounded set of rows held column by column
class ColumnBatch {
public:
    explicit ColumnBatch(ColumnConfigVector schema);

    const ColumnConfigVector& schema() const noexcept { return schema_; }
    size_t num_columns() const noexcept { return columns_.size(); }
    size_t num_rows() const noexcept { return num_rows_; }
    bool empty() const noexcept { return num_rows_ == 0; }

    std::optional<size_t> column_index(const std::string& name) const;

    const ColumnVector& column(size_t index) const { return columns_.at(index); }
    ColumnVector& column(size_t index) { return columns_.at(index); }

    // Row must match the schema width and types
    void append_row(RowType&& row);

    // Appends a fully built column, all columns must end with the same length
    void set_column(size_t index, ColumnVector&& column);

    RowType row(size_t index) const;

    void reserve(size_t rows);
    void clear() noexcept;

private:
    ColumnConfigVector schema_;
    std::vector<ColumnVector> columns_;
    size_t num_rows_ = 0;
};

#pragma once

#include <string>
#include <vector>
#include "AggregationConfig.h"
#include "ColumnarReader.h"


// A columnar aggregation source projected onto the columns one
// AggregationConfig reads, with its filters bound to the column types.
class AggregationSource {
public:
    AggregationSource(const std::string& path, const AggregationConfig& config);

    AggregationSource(const AggregationSource&) = delete;
    AggregationSource& operator=(const AggregationSource&) = delete;
    AggregationSource(AggregationSource&&) = delete;
    AggregationSource& operator=(AggregationSource&&) = delete;

    ~AggregationSource() = default;

    const std::string& path() const noexcept { return reader_.path(); }
    uint64_t num_rows() const noexcept { return reader_.num_rows(); }
    size_t num_row_groups() const noexcept { return reader_.num_row_groups(); }

    // Projected schema, the layout of every batch read_row_group returns
    const ColumnConfigVector& schema() const noexcept { return schema_; }
    size_t slot(const std::string& column) const;

    size_t key_slot() const noexcept { return key_slot_; }
    size_t order_slot() const noexcept { return order_slot_; }

    ColumnBatch read_row_group(size_t row_group);

    // Passes every filter and has a key and ordering value that are neither null nor NaN
    bool accepts(const ColumnBatch& batch, size_t row) const;

private:
    struct BoundFilter {
        size_t slot;
        FilterOp op;
        bool numeric;
        double number;
        std::string text;
    };

    static bool compare(FilterOp op, int cmp) noexcept;
    bool passes(const BoundFilter& filter, const ColumnBatch& batch, size_t row) const;

    ColumnarReader reader_;
    std::vector<size_t> projection_;
    ColumnConfigVector schema_;
    std::vector<BoundFilter> filters_;
    size_t key_slot_ = 0;
    size_t order_slot_ = 0;
};

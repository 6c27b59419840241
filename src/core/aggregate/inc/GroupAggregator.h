#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "AggregationConfig.h"
#include "AggregationResult.h"
#include "AggregationSource.h"
#include "ConvertOptions.h"


// Many-to-one conversion: one output row per distinct group key, sorted by key.
class GroupAggregator {
public:
    GroupAggregator(const AggregationConfig& config, const ConvertOptions& options);

    GroupAggregator(const GroupAggregator&) = delete;
    GroupAggregator& operator=(const GroupAggregator&) = delete;

    ~GroupAggregator() = default;

    // Aggregates, then runs the aggregation tiers unless validation is off
    AggregationResult aggregate(const std::string& source_path, const std::string& output_path);

    // Key column first, then one column per field
    static ColumnConfigVector output_schema(const AggregationConfig& config, const ColumnConfigVector& source_schema);

private:
    struct FieldState {
        bool seen = false;
        ColumnType value;
        ColumnType order;
        // (ordering value, item) in source order
        std::vector<std::pair<ColumnType, int64_t>> items;
    };

    struct GroupState {
        int64_t count = 0;
        std::vector<FieldState> fields;
    };

    void update(GroupState& state, const ColumnBatch& batch, size_t row) const;
    RowType finalize(const ColumnType& key, GroupState& state) const;

    AggregationConfig config_;
    ConvertOptions options_;
    std::vector<std::optional<size_t>> field_slots_;
    size_t order_slot_ = 0;
};

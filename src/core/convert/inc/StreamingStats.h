#pragma once

#include <cstdint>
#include <map>
#include <string>
#include "ColumnBatch.h"
#include "TypeConfig.h"


// Running totals of one conversion, updated once per written batch.
// Holds no row data.
struct StreamingStats {
    int64_t row_count = 0;
    double checksum_sum = 0.0;
    // Key column name to non-null values seen
    std::map<std::string, int64_t> non_null_counts;
    ColumnConfigVector observed_schema;
    int64_t batch_count = 0;

    // Checksum values are added one at a time in row order, so the sum
    // does not depend on where batch boundaries fall. NaN and infinities
    // are left out of the sum.
    void accumulate(const ColumnBatch& batch, const TypeConfig& type_config);
};

#include "StreamingStats.h"


void StreamingStats::accumulate(const ColumnBatch& batch, const TypeConfig& type_config) {
    row_count += static_cast<int64_t>(batch.num_rows());
    ++batch_count;

    if (type_config.checksum_column) {
        if (auto index = batch.column_index(*type_config.checksum_column)) {
            const ColumnVector& column = batch.column(*index);
            for (size_t i = 0; i < column.size(); ++i) {
                if (auto value = column.finite_at(i)) {
                    checksum_sum += *value;
                }
            }
        }
    }

    for (const auto& key : type_config.key_columns) {
        int64_t& count = non_null_counts[key];
        if (auto index = batch.column_index(key)) {
            const ColumnVector& column = batch.column(*index);
            count += static_cast<int64_t>(column.size() - column.null_count());
        }
    }
}

#pragma once

#include <memory>
#include <arrow/api.h>
#include "ColumnBatch.h"


// Mapping between column batches and Arrow arrays
//
//   BIGINT      <-> int64
//   DOUBLE      <-> double
//   VARCHAR     <-> utf8
//   BIGINT_LIST <-> list<int64>
//
namespace ArrowUtils {

    // Throws std::invalid_argument for UNKNOWN
    std::shared_ptr<arrow::DataType> to_arrow_type(ColumnTypeTag tag);

    // UNKNOWN when the Arrow type has no column counterpart
    ColumnTypeTag from_arrow_type(const arrow::DataType& type);

    std::shared_ptr<arrow::Schema> to_arrow_schema(const ColumnConfigVector& schema);

    arrow::Result<std::shared_ptr<arrow::Array>> to_arrow_array(const ColumnVector& column);

    arrow::Result<std::shared_ptr<arrow::Table>> to_arrow_table(const ColumnBatch& batch,
                                                                const std::shared_ptr<arrow::Schema>& schema);

    // Throws std::invalid_argument when the array type does not match
    ColumnVector to_column_vector(const arrow::ChunkedArray& array, ColumnTypeTag type);

}

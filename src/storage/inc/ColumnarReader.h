#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <parquet/arrow/reader.h>
#include <parquet/metadata.h>
#include "ColumnBatch.h"

using KeyValueMetadata = std::vector<std::pair<std::string, std::string>>;


// Reads Parquet files written by ColumnarWriter, or any file whose columns
// are int64, double, utf8 or list<int64>. Opening reads only the footer, so
// row counts and schema come without touching column data.
class ColumnarReader {
public:
    explicit ColumnarReader(const std::string& path);

    ColumnarReader(const ColumnarReader&) = delete;
    ColumnarReader& operator=(const ColumnarReader&) = delete;
    ColumnarReader(ColumnarReader&&) = delete;
    ColumnarReader& operator=(ColumnarReader&&) = delete;

    ~ColumnarReader() = default;

    const std::string& path() const noexcept { return path_; }
    const ColumnConfigVector& schema() const noexcept { return schema_; }
    uint64_t num_rows() const noexcept { return num_rows_; }
    size_t num_row_groups() const noexcept { return static_cast<size_t>(file_metadata_->num_row_groups()); }
    uint64_t row_group_num_rows(size_t row_group) const;

    std::optional<size_t> column_index(const std::string& name) const;

    ColumnVector read_column(size_t row_group, size_t column);

    // Projected batch holding only the given columns, in the given order
    ColumnBatch read_row_group(size_t row_group, const std::vector<size_t>& columns);
    ColumnBatch read_row_group(size_t row_group);

    // Rows at ascending positions, decoding only the row groups that hold one
    std::vector<RowType> read_rows(const std::vector<int64_t>& positions);

    // Key/value metadata of the file, the stored Arrow schema excluded
    const KeyValueMetadata& metadata() const noexcept { return metadata_; }
    std::optional<std::string> metadata_value(const std::string& key) const;

private:
    std::string path_;
    std::unique_ptr<parquet::arrow::FileReader> reader_;
    std::shared_ptr<parquet::FileMetaData> file_metadata_;
    ColumnConfigVector schema_;
    uint64_t num_rows_ = 0;
    KeyValueMetadata metadata_;
};

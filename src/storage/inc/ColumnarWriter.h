#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>
#include "ColumnBatch.h"
#include "ConvertOptions.h"


// Writes Parquet files, one row group per batch, ZSTD compressed.
// Rows go to "<path>.partial" and close() renames it onto the path; a writer
// destroyed without close() removes the partial file, so a failed run leaves
// no output behind.
class ColumnarWriter {
public:
    // 0 stores pages uncompressed, otherwise the ZSTD level
    ColumnarWriter(const std::string& path, ColumnConfigVector schema,
                   int compression_level = ConvertOptions::DEFAULT_COMPRESSION_LEVEL);

    ColumnarWriter(const ColumnarWriter&) = delete;
    ColumnarWriter& operator=(const ColumnarWriter&) = delete;
    ColumnarWriter(ColumnarWriter&&) = delete;
    ColumnarWriter& operator=(ColumnarWriter&&) = delete;

    ~ColumnarWriter();

    // Throws SchemaValidationError when the batch schema differs
    void write_batch(const ColumnBatch& batch);

    // File level key/value metadata, written by close()
    void set_metadata(const std::string& key, const std::string& value);

    void close();

    const std::string& path() const noexcept { return path_; }
    const std::string& partial_path() const noexcept { return partial_path_; }
    const ColumnConfigVector& schema() const noexcept { return schema_; }
    uint64_t rows_written() const noexcept { return rows_written_; }
    size_t row_groups_written() const noexcept { return row_groups_written_; }
    bool is_closed() const noexcept { return closed_; }

private:
    void discard() noexcept;

    std::string path_;
    std::string partial_path_;
    ColumnConfigVector schema_;
    std::shared_ptr<arrow::Schema> arrow_schema_;
    std::shared_ptr<arrow::io::FileOutputStream> out_;
    std::unique_ptr<parquet::arrow::FileWriter> writer_;
    std::vector<std::pair<std::string, std::string>> metadata_;
    uint64_t rows_written_ = 0;
    size_t row_groups_written_ = 0;
    bool closed_ = false;
};

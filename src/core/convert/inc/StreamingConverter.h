#pragma once

#include <string>
#include "CSVReader.h"
#include "ColumnarWriter.h"
#include "ConvertOptions.h"
#include "StreamingStats.h"
#include "TypeConfig.h"


// Streams a delimited source into a Parquet file, one row group per batch.
class StreamingConverter {
public:
    // Progress is logged every this many batches
    static constexpr int64_t PROGRESS_INTERVAL = 10;

    StreamingConverter(const TypeConfig& type_config, const ConvertOptions& options);

    StreamingConverter(const StreamingConverter&) = delete;
    StreamingConverter& operator=(const StreamingConverter&) = delete;
    StreamingConverter(StreamingConverter&&) = delete;
    StreamingConverter& operator=(StreamingConverter&&) = delete;

    ~StreamingConverter() = default;

    // Throws CSVParseError on the first bad row, leaving no file at output_path
    StreamingStats convert(const std::string& source_path, const std::string& output_path);

    // Header columns take the declared type, unknown columns become VARCHAR
    ColumnConfigVector resolve_schema(const CSVRow& header, const std::string& source_path) const;

private:
    RowType parse_record(const CSVRecord& record, int64_t row_index, const std::string& source_path) const;
    void flush_batch(ColumnBatch& batch, StreamingStats& stats, ColumnarWriter& writer);
    void finish(StreamingStats& stats, const std::string& source_path, ColumnarWriter& writer);

    TypeConfig type_config_;
    ConvertOptions options_;
    ColumnConfigVector schema_;
};

#include "ColumnarWriter.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <arrow/util/key_value_metadata.h>
#include <parquet/properties.h>
#include "ArrowUtils.h"
#include "ConvertError.h"
#include "LogUtils.h"


namespace {

    std::shared_ptr<parquet::WriterProperties> writer_properties(int compression_level) {
        parquet::WriterProperties::Builder builder;
        if (compression_level == 0) {
            builder.compression(parquet::Compression::UNCOMPRESSED);
        } else {
            builder.compression(parquet::Compression::ZSTD);
            builder.compression_level(compression_level);
        }
        // row groups follow write_batch, never split by the writer
        builder.max_row_group_length(std::numeric_limits<int64_t>::max());
        return builder.build();
    }

}

ColumnarWriter::ColumnarWriter(const std::string& path, ColumnConfigVector schema, int compression_level)
    : path_(path), partial_path_(path + ".partial"), schema_(std::move(schema)) {
    if (compression_level < 0 || compression_level > ConvertOptions::MAX_COMPRESSION_LEVEL) {
        throw std::invalid_argument("Compression level must be between 0 and " +
                                    std::to_string(ConvertOptions::MAX_COMPRESSION_LEVEL) + ": " +
                                    std::to_string(compression_level));
    }
    arrow_schema_ = ArrowUtils::to_arrow_schema(schema_);

    // 旧的输出先删掉, 失败的转换不留文件
    errno = 0;
    if (std::remove(path_.c_str()) != 0 && errno != ENOENT) {
        throw OutputWriteError(path_, std::strerror(errno));
    }

    auto out = arrow::io::FileOutputStream::Open(partial_path_);
    if (!out.ok()) {
        throw OutputWriteError(path_, out.status().ToString());
    }
    out_ = out.ValueOrDie();

    auto arrow_properties = parquet::ArrowWriterProperties::Builder().store_schema()->build();
    auto writer = parquet::arrow::FileWriter::Open(*arrow_schema_, arrow::default_memory_pool(), out_,
                                                   writer_properties(compression_level), arrow_properties);
    if (!writer.ok()) {
        discard();
        throw OutputWriteError(path_, writer.status().ToString());
    }
    writer_ = std::move(writer).ValueOrDie();
}

ColumnarWriter::~ColumnarWriter() {
    if (!closed_) {
        warnPrint("Columnar output %s was not closed, removing %s\n", path_.c_str(), partial_path_.c_str());
        discard();
    }
}

void ColumnarWriter::discard() noexcept {
    writer_.reset();
    if (out_ && !out_->closed()) {
        arrow::Status status = out_->Close();
        if (!status.ok()) {
            debugPrint("Closing %s: %s\n", partial_path_.c_str(), status.ToString().c_str());
        }
    }
    out_.reset();
    errno = 0;
    if (std::remove(partial_path_.c_str()) != 0 && errno != ENOENT) {
        errorPrint("Failed to remove %s: %s\n", partial_path_.c_str(), std::strerror(errno));
    }
}

void ColumnarWriter::write_batch(const ColumnBatch& batch) {
    if (closed_) {
        throw OutputWriteError(path_, "write after close");
    }
    if (batch.schema() != schema_) {
        throw SchemaValidationError(column_names(schema_), column_names(batch.schema()), path_,
                                    "batch schema differs from the schema the output was opened with");
    }
    if (batch.empty()) {
        return;
    }

    auto table = ArrowUtils::to_arrow_table(batch, arrow_schema_);
    if (!table.ok()) {
        throw OutputWriteError(path_, table.status().ToString());
    }
    arrow::Status status = writer_->WriteTable(*table.ValueOrDie(), static_cast<int64_t>(batch.num_rows()));
    if (!status.ok()) {
        throw OutputWriteError(path_, status.ToString());
    }

    rows_written_ += batch.num_rows();
    ++row_groups_written_;
    debugPrint("Wrote row group %zu (%zu rows) to %s\n",
               row_groups_written_ - 1, batch.num_rows(), partial_path_.c_str());
}

void ColumnarWriter::set_metadata(const std::string& key, const std::string& value) {
    for (auto& entry : metadata_) {
        if (entry.first == key) {
            entry.second = value;
            return;
        }
    }
    metadata_.emplace_back(key, value);
}

void ColumnarWriter::close() {
    if (closed_) {
        return;
    }

    if (!metadata_.empty()) {
        auto kv = std::make_shared<arrow::KeyValueMetadata>();
        for (const auto& [key, value] : metadata_) {
            kv->Append(key, value);
        }
        arrow::Status status = writer_->AddKeyValueMetadata(kv);
        if (!status.ok()) {
            throw OutputWriteError(path_, status.ToString());
        }
    }

    arrow::Status status = writer_->Close();
    if (!status.ok()) {
        throw OutputWriteError(path_, status.ToString());
    }
    if (!out_->closed()) {
        status = out_->Close();
        if (!status.ok()) {
            throw OutputWriteError(path_, status.ToString());
        }
    }

    errno = 0;
    if (std::rename(partial_path_.c_str(), path_.c_str()) != 0) {
        throw OutputWriteError(path_, std::string("rename from ") + partial_path_ + ": " + std::strerror(errno));
    }
    closed_ = true;
}

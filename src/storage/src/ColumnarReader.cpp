#include "ColumnarReader.h"
#include <map>
#include <stdexcept>
#include <arrow/io/file.h>
#include <arrow/util/key_value_metadata.h>
#include "ArrowUtils.h"
#include "ConvertError.h"


namespace {

    // written by store_schema(), not user metadata
    constexpr const char* ARROW_SCHEMA_KEY = "ARROW:schema";

}

ColumnarReader::ColumnarReader(const std::string& path) : path_(path) {
    auto in = arrow::io::ReadableFile::Open(path);
    if (!in.ok()) {
        throw SourceUnreadableError(path, in.status().ToString());
    }

    auto reader = parquet::arrow::OpenFile(in.ValueOrDie(), arrow::default_memory_pool());
    if (!reader.ok()) {
        throw SourceUnreadableError(path, reader.status().ToString());
    }
    reader_ = std::move(reader).ValueOrDie();
    file_metadata_ = reader_->parquet_reader()->metadata();
    num_rows_ = static_cast<uint64_t>(file_metadata_->num_rows());

    std::shared_ptr<arrow::Schema> arrow_schema;
    arrow::Status status = reader_->GetSchema(&arrow_schema);
    if (!status.ok()) {
        throw SourceUnreadableError(path, status.ToString());
    }
    // one leaf per field, so field and leaf indices agree
    if (file_metadata_->num_columns() != arrow_schema->num_fields()) {
        throw SourceUnreadableError(path, "nested columns are not supported");
    }

    schema_.reserve(static_cast<size_t>(arrow_schema->num_fields()));
    for (const auto& field : arrow_schema->fields()) {
        ColumnTypeTag tag = ArrowUtils::from_arrow_type(*field->type());
        if (tag == ColumnTypeTag::UNKNOWN) {
            throw SourceUnreadableError(path, "unsupported type " + field->type()->ToString() +
                                              " for column '" + field->name() + "'");
        }
        schema_.emplace_back(field->name(), tag);
    }

    auto kv = file_metadata_->key_value_metadata();
    if (kv) {
        for (int64_t i = 0; i < kv->size(); ++i) {
            if (kv->key(i) != ARROW_SCHEMA_KEY) {
                metadata_.emplace_back(kv->key(i), kv->value(i));
            }
        }
    }
}

uint64_t ColumnarReader::row_group_num_rows(size_t row_group) const {
    if (row_group >= num_row_groups()) {
        throw std::out_of_range("Row group " + std::to_string(row_group) + " out of range");
    }
    return static_cast<uint64_t>(file_metadata_->RowGroup(static_cast<int>(row_group))->num_rows());
}

std::optional<size_t> ColumnarReader::column_index(const std::string& name) const {
    for (size_t i = 0; i < schema_.size(); ++i) {
        if (schema_[i].name == name) {
            return i;
        }
    }
    return std::nullopt;
}

ColumnVector ColumnarReader::read_column(size_t row_group, size_t column) {
    ColumnBatch batch = read_row_group(row_group, {column});
    return std::move(batch.column(0));
}

ColumnBatch ColumnarReader::read_row_group(size_t row_group, const std::vector<size_t>& columns) {
    if (row_group >= num_row_groups()) {
        throw std::out_of_range("Row group " + std::to_string(row_group) + " out of range");
    }

    // the Parquet reader drops repeated indices, so read each column once
    ColumnConfigVector projected;
    std::vector<int> indices;
    std::map<size_t, int> table_position;
    projected.reserve(columns.size());
    for (size_t index : columns) {
        projected.push_back(schema_.at(index));
        if (table_position.emplace(index, static_cast<int>(indices.size())).second) {
            indices.push_back(static_cast<int>(index));
        }
    }

    std::shared_ptr<arrow::Table> table;
    arrow::Status status = reader_->ReadRowGroup(static_cast<int>(row_group), indices, &table);
    if (!status.ok()) {
        throw SourceUnreadableError(path_, "row group " + std::to_string(row_group) + ": " + status.ToString());
    }

    ColumnBatch batch(std::move(projected));
    for (size_t i = 0; i < columns.size(); ++i) {
        const auto& array = table->column(table_position[columns[i]]);
        try {
            batch.set_column(i, ArrowUtils::to_column_vector(*array, batch.schema()[i].type_tag));
        } catch (const std::invalid_argument& e) {
            throw SourceUnreadableError(path_, e.what());
        }
    }
    return batch;
}

ColumnBatch ColumnarReader::read_row_group(size_t row_group) {
    std::vector<size_t> columns(schema_.size());
    for (size_t i = 0; i < columns.size(); ++i) {
        columns[i] = i;
    }
    return read_row_group(row_group, columns);
}

std::vector<RowType> ColumnarReader::read_rows(const std::vector<int64_t>& positions) {
    std::vector<RowType> rows;
    rows.reserve(positions.size());
    int64_t base = 0;
    for (size_t rg = 0; rg < num_row_groups() && rows.size() < positions.size(); ++rg) {
        const int64_t group_rows = static_cast<int64_t>(row_group_num_rows(rg));
        if (positions[rows.size()] >= base + group_rows) {
            base += group_rows;
            continue;
        }
        ColumnBatch batch = read_row_group(rg);
        while (rows.size() < positions.size() && positions[rows.size()] < base + group_rows) {
            if (positions[rows.size()] < base) {
                throw std::invalid_argument("Row positions must be ascending");
            }
            rows.push_back(batch.row(static_cast<size_t>(positions[rows.size()] - base)));
        }
        base += group_rows;
    }
    if (rows.size() < positions.size()) {
        throw std::out_of_range("Row position " + std::to_string(positions[rows.size()]) +
                                " beyond " + std::to_string(num_rows()) + " rows");
    }
    return rows;
}

std::optional<std::string> ColumnarReader::metadata_value(const std::string& key) const {
    for (const auto& [k, v] : metadata_) {
        if (k == key) {
            return v;
        }
    }
    return std::nullopt;
}

#include "StreamingConverter.h"
#include <algorithm>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>
#include "CSVUtils.h"
#include "ConvertError.h"
#include "LogUtils.h"
#include "StringUtils.h"


StreamingConverter::StreamingConverter(const TypeConfig& type_config, const ConvertOptions& options)
    : type_config_(type_config), options_(options) {
    if (options_.batch_size == 0) {
        throw std::invalid_argument("batch_size must be positive");
    }
}

ColumnConfigVector StreamingConverter::resolve_schema(const CSVRow& header, const std::string& source_path) const {
    if (!type_config_.has_header) {
        return type_config_.columns;
    }

    std::set<std::string> seen;
    std::set<std::string> duplicates;
    for (const auto& name : header) {
        if (!seen.insert(name).second) {
            duplicates.insert(name);
        }
    }
    if (!duplicates.empty()) {
        throw SchemaValidationError(type_config_.expected_columns(), header, source_path,
                                    "duplicate header columns: " +
                                    StringUtils::join(std::vector<std::string>(duplicates.begin(), duplicates.end()), ", "));
    }

    ColumnConfigVector schema;
    schema.reserve(header.size());
    for (const auto& name : header) {
        if (const ColumnConfig* declared = type_config_.find_column(name)) {
            schema.push_back(*declared);
        } else {
            schema.emplace_back(name, ColumnTypeTag::VARCHAR);
        }
    }
    return schema;
}

RowType StreamingConverter::parse_record(const CSVRecord& record, int64_t row_index,
                                         const std::string& source_path) const {
    if (record.fields.size() != schema_.size()) {
        throw CSVParseError(source_path, row_index, record.line_number, "", "", record.raw_text,
                            "expected " + std::to_string(schema_.size()) + " fields, found " +
                            std::to_string(record.fields.size()));
    }

    RowType row;
    row.reserve(schema_.size());
    for (size_t i = 0; i < schema_.size(); ++i) {
        const std::string& field = record.fields[i];
        if (type_config_.is_null_token(field)) {
            row.emplace_back(std::monostate{});
            continue;
        }
        try {
            row.push_back(CSVUtils::convert_to_type(field, schema_[i].type_tag));
        } catch (const std::invalid_argument& e) {
            throw CSVParseError(source_path, row_index, record.line_number, schema_[i].name, field,
                                record.raw_text, e.what());
        }
    }
    return row;
}

void StreamingConverter::flush_batch(ColumnBatch& batch, StreamingStats& stats, ColumnarWriter& writer) {
    writer.write_batch(batch);
    stats.accumulate(batch, type_config_);
    batch.clear();

    if (stats.batch_count % PROGRESS_INTERVAL == 0) {
        infoPrint("%s: %ld rows converted in %ld batches\n",
                  type_config_.name.c_str(), static_cast<long>(stats.row_count), static_cast<long>(stats.batch_count));
    }
}

void StreamingConverter::finish(StreamingStats& stats, const std::string& source_path, ColumnarWriter& writer) {
    writer.set_metadata("pfconvert.dataset", type_config_.name);
    writer.set_metadata("pfconvert.source", source_path);
    writer.set_metadata("pfconvert.row_count", std::to_string(stats.row_count));
    if (type_config_.checksum_column) {
        std::ostringstream sum;
        sum << std::setprecision(17) << stats.checksum_sum;
        writer.set_metadata("pfconvert.checksum_column", *type_config_.checksum_column);
        writer.set_metadata("pfconvert.checksum_sum", sum.str());
    }
    writer.close();
}

StreamingStats StreamingConverter::convert(const std::string& source_path, const std::string& output_path) {
    CSVReader reader(source_path, type_config_.has_header, type_config_.delimiter);

    schema_ = resolve_schema(reader.header(), source_path);
    // a header-only source still yields a file carrying the schema
    ColumnarWriter writer(output_path, schema_, options_.compression_level);

    StreamingStats stats;
    stats.observed_schema = schema_;
    for (const auto& key : type_config_.key_columns) {
        stats.non_null_counts[key] = 0;
    }

    debugPrint("Converting %s -> %s, %zu columns, batch size %zu\n",
               source_path.c_str(), output_path.c_str(), schema_.size(), options_.batch_size);

    ColumnBatch batch(schema_);
    batch.reserve(std::min<size_t>(options_.batch_size, 65536));

    while (auto record = reader.read_next()) {
        int64_t row_index = stats.row_count + static_cast<int64_t>(batch.num_rows());
        batch.append_row(parse_record(*record, row_index, source_path));
        if (batch.num_rows() >= options_.batch_size) {
            flush_batch(batch, stats, writer);
        }
    }
    if (!batch.empty()) {
        flush_batch(batch, stats, writer);
    }

    finish(stats, source_path, writer);

    infoPrint("%s: converted %ld rows from %s to %s\n", type_config_.name.c_str(),
              static_cast<long>(stats.row_count), source_path.c_str(), output_path.c_str());
    return stats;
}

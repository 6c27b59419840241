#include "ArrowUtils.h"
#include <stdexcept>
#include <string>
#include <vector>


namespace ArrowUtils {

    std::shared_ptr<arrow::DataType> to_arrow_type(ColumnTypeTag tag) {
        switch (tag) {
            case ColumnTypeTag::BIGINT:      return arrow::int64();
            case ColumnTypeTag::DOUBLE:      return arrow::float64();
            case ColumnTypeTag::VARCHAR:     return arrow::utf8();
            case ColumnTypeTag::BIGINT_LIST: return arrow::list(arrow::int64());
            default:
                throw std::invalid_argument(std::string("No storage type for column type ") + type_tag_name(tag));
        }
    }

    ColumnTypeTag from_arrow_type(const arrow::DataType& type) {
        switch (type.id()) {
            case arrow::Type::INT64:  return ColumnTypeTag::BIGINT;
            case arrow::Type::DOUBLE: return ColumnTypeTag::DOUBLE;
            case arrow::Type::STRING: return ColumnTypeTag::VARCHAR;
            case arrow::Type::LIST: {
                const auto& list = static_cast<const arrow::ListType&>(type);
                if (list.value_type()->id() == arrow::Type::INT64) {
                    return ColumnTypeTag::BIGINT_LIST;
                }
                return ColumnTypeTag::UNKNOWN;
            }
            default:
                return ColumnTypeTag::UNKNOWN;
        }
    }

    std::shared_ptr<arrow::Schema> to_arrow_schema(const ColumnConfigVector& schema) {
        std::vector<std::shared_ptr<arrow::Field>> fields;
        fields.reserve(schema.size());
        for (const auto& column : schema) {
            fields.push_back(arrow::field(column.name, to_arrow_type(column.type_tag), true));
        }
        return arrow::schema(std::move(fields));
    }

    arrow::Result<std::shared_ptr<arrow::Array>> to_arrow_array(const ColumnVector& column) {
        const auto rows = static_cast<int64_t>(column.size());
        std::shared_ptr<arrow::Array> array;

        switch (column.type()) {
            case ColumnTypeTag::BIGINT: {
                arrow::Int64Builder builder;
                ARROW_RETURN_NOT_OK(builder.Reserve(rows));
                for (size_t i = 0; i < column.size(); ++i) {
                    if (column.is_null(i)) {
                        ARROW_RETURN_NOT_OK(builder.AppendNull());
                    } else {
                        ARROW_RETURN_NOT_OK(builder.Append(column.bigint_at(i)));
                    }
                }
                ARROW_RETURN_NOT_OK(builder.Finish(&array));
                break;
            }
            case ColumnTypeTag::DOUBLE: {
                arrow::DoubleBuilder builder;
                ARROW_RETURN_NOT_OK(builder.Reserve(rows));
                for (size_t i = 0; i < column.size(); ++i) {
                    if (column.is_null(i)) {
                        ARROW_RETURN_NOT_OK(builder.AppendNull());
                    } else {
                        ARROW_RETURN_NOT_OK(builder.Append(column.double_at(i)));
                    }
                }
                ARROW_RETURN_NOT_OK(builder.Finish(&array));
                break;
            }
            case ColumnTypeTag::VARCHAR: {
                arrow::StringBuilder builder;
                ARROW_RETURN_NOT_OK(builder.Reserve(rows));
                for (size_t i = 0; i < column.size(); ++i) {
                    if (column.is_null(i)) {
                        ARROW_RETURN_NOT_OK(builder.AppendNull());
                    } else {
                        ARROW_RETURN_NOT_OK(builder.Append(column.string_at(i)));
                    }
                }
                ARROW_RETURN_NOT_OK(builder.Finish(&array));
                break;
            }
            case ColumnTypeTag::BIGINT_LIST: {
                auto values = std::make_shared<arrow::Int64Builder>();
                arrow::ListBuilder builder(arrow::default_memory_pool(), values, to_arrow_type(ColumnTypeTag::BIGINT_LIST));
                ARROW_RETURN_NOT_OK(builder.Reserve(rows));
                for (size_t i = 0; i < column.size(); ++i) {
                    if (column.is_null(i)) {
                        ARROW_RETURN_NOT_OK(builder.AppendNull());
                        continue;
                    }
                    ARROW_RETURN_NOT_OK(builder.Append());
                    const BigintList& list = column.list_at(i);
                    ARROW_RETURN_NOT_OK(values->AppendValues(list.data(), static_cast<int64_t>(list.size())));
                }
                ARROW_RETURN_NOT_OK(builder.Finish(&array));
                break;
            }
            default:
                return arrow::Status::Invalid("Column has no type");
        }
        return array;
    }

    arrow::Result<std::shared_ptr<arrow::Table>> to_arrow_table(const ColumnBatch& batch,
                                                                const std::shared_ptr<arrow::Schema>& schema) {
        std::vector<std::shared_ptr<arrow::Array>> arrays;
        arrays.reserve(batch.num_columns());
        for (size_t i = 0; i < batch.num_columns(); ++i) {
            ARROW_ASSIGN_OR_RAISE(auto array, to_arrow_array(batch.column(i)));
            arrays.push_back(std::move(array));
        }
        return arrow::Table::Make(schema, arrays, static_cast<int64_t>(batch.num_rows()));
    }

    ColumnVector to_column_vector(const arrow::ChunkedArray& array, ColumnTypeTag type) {
        if (from_arrow_type(*array.type()) != type) {
            throw std::invalid_argument("Stored type " + array.type()->ToString() +
                                        " does not match column type " + type_tag_name(type));
        }

        ColumnVector column(type);
        column.reserve(static_cast<size_t>(array.length()));
        for (const auto& chunk : array.chunks()) {
            switch (type) {
                case ColumnTypeTag::BIGINT: {
                    const auto& values = static_cast<const arrow::Int64Array&>(*chunk);
                    for (int64_t i = 0; i < values.length(); ++i) {
                        if (values.IsNull(i)) {
                            column.append_null();
                        } else {
                            column.append(ColumnType(values.Value(i)));
                        }
                    }
                    break;
                }
                case ColumnTypeTag::DOUBLE: {
                    const auto& values = static_cast<const arrow::DoubleArray&>(*chunk);
                    for (int64_t i = 0; i < values.length(); ++i) {
                        if (values.IsNull(i)) {
                            column.append_null();
                        } else {
                            column.append(ColumnType(values.Value(i)));
                        }
                    }
                    break;
                }
                case ColumnTypeTag::VARCHAR: {
                    const auto& values = static_cast<const arrow::StringArray&>(*chunk);
                    for (int64_t i = 0; i < values.length(); ++i) {
                        if (values.IsNull(i)) {
                            column.append_null();
                        } else {
                            column.append(ColumnType(values.GetString(i)));
                        }
                    }
                    break;
                }
                case ColumnTypeTag::BIGINT_LIST: {
                    const auto& lists = static_cast<const arrow::ListArray&>(*chunk);
                    const auto& elements = static_cast<const arrow::Int64Array&>(*lists.values());
                    for (int64_t i = 0; i < lists.length(); ++i) {
                        if (lists.IsNull(i)) {
                            column.append_null();
                            continue;
                        }
                        BigintList list;
                        list.reserve(static_cast<size_t>(lists.value_length(i)));
                        for (int64_t j = lists.value_offset(i); j < lists.value_offset(i + 1); ++j) {
                            list.push_back(elements.Value(j));
                        }
                        column.append(ColumnType(std::move(list)));
                    }
                    break;
                }
                default:
                    throw std::invalid_argument("Column has no type");
            }
        }
        return column;
    }

}

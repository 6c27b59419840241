#pragma once

#include "TypeConfig.h"
#include "AggregationConfig.h"
#include "ConvertOptions.h"
#include "ConfigError.h"

#include <string>
#include <vector>
#include <optional>

#include <yaml-cpp/yaml.h>


namespace YAML {

    template<>
    struct convert<ColumnConfig> {
        static bool decode(const Node& node, ColumnConfig& rhs) {
            if (!node["name"]) {
                throw ConfigError("Missing required field 'name' for ColumnConfig.", "columns");
            }
            if (!node["type"]) {
                throw ConfigError("Missing required field 'type' for ColumnConfig.", "columns");
            }

            rhs.name = node["name"].as<std::string>();
            rhs.type = node["type"].as<std::string>();
            try {
                rhs.calc_type_tag();
            } catch (const std::runtime_error& e) {
                ConfigError error(std::string(e.what()) + " for column '" + rhs.name + "'", "columns.type");
                error.suggestions = {"integer", "float", "string"};
                throw error;
            }
            return true;
        }
    };


    template<>
    struct convert<ChecksumTolerance> {
        static bool decode(const Node& node, ChecksumTolerance& rhs) {
            if (node["absolute"]) rhs.absolute = node["absolute"].as<double>();
            if (node["relative"]) rhs.relative = node["relative"].as<double>();
            return true;
        }
    };


    template<>
    struct convert<ConvertOptions> {
        static bool decode(const Node& node, ConvertOptions& rhs) {
            if (node["validate"]) rhs.validate = node["validate"].as<bool>();
            if (node["sample_size"]) rhs.sample_size = node["sample_size"].as<size_t>();
            if (node["batch_size"]) {
                rhs.batch_size = node["batch_size"].as<size_t>();
                if (rhs.batch_size == 0) {
                    throw ConfigError("batch_size must be positive", "options.batch_size");
                }
            }
            if (node["seed"]) rhs.seed = node["seed"].as<uint64_t>();
            if (node["compression_level"]) {
                rhs.compression_level = node["compression_level"].as<int>();
                if (rhs.compression_level < 0 || rhs.compression_level > ConvertOptions::MAX_COMPRESSION_LEVEL) {
                    throw ConfigError("compression_level must be between 0 and " +
                                      std::to_string(ConvertOptions::MAX_COMPRESSION_LEVEL), "options.compression_level");
                }
            }
            return true;
        }
    };


    template<>
    struct convert<TypeConfig> {
        static bool decode(const Node& node, TypeConfig& rhs) {
            if (!node["name"]) {
                throw ConfigError("Missing required field 'name' in TypeConfig.", "name");
            }
            if (!node["columns"] || !node["columns"].IsSequence()) {
                throw ConfigError("Missing required sequence 'columns' in TypeConfig.", "columns");
            }

            rhs.name = node["name"].as<std::string>();
            rhs.columns = node["columns"].as<ColumnConfigVector>();

            if (node["null_tokens"]) {
                rhs.null_tokens = node["null_tokens"].as<std::vector<std::string>>();
            }
            if (node["key_columns"]) {
                rhs.key_columns = node["key_columns"].as<std::vector<std::string>>();
            }
            if (node["checksum_column"] && !node["checksum_column"].IsNull()) {
                rhs.checksum_column = node["checksum_column"].as<std::string>();
            }
            if (node["default_sample_size"]) {
                rhs.default_sample_size = node["default_sample_size"].as<size_t>();
            }
            if (node["delimiter"]) {
                auto delimiter = node["delimiter"].as<std::string>();
                if (delimiter == "\\t") delimiter = "\t";
                if (delimiter.size() != 1) {
                    throw ConfigError("Delimiter must be a single character: " + delimiter, "delimiter");
                }
                rhs.delimiter = delimiter[0];
            }
            if (node["has_header"]) {
                rhs.has_header = node["has_header"].as<bool>();
            }
            if (node["checksum_tolerance"]) {
                rhs.checksum_tolerance = node["checksum_tolerance"].as<ChecksumTolerance>();
            }
            return true;
        }
    };


    template<>
    struct convert<FilterConfig> {
        static bool decode(const Node& node, FilterConfig& rhs) {
            if (!node["column"]) {
                throw ConfigError("Missing required field 'column' for filter.", "filters");
            }
            if (!node["op"]) {
                throw ConfigError("Missing required field 'op' for filter.", "filters");
            }
            rhs.column = node["column"].as<std::string>();
            rhs.op = parse_filter_op(node["op"].as<std::string>());
            if (node["value"]) {
                rhs.value = node["value"].as<std::string>();
            }
            return true;
        }
    };


    template<>
    struct convert<FieldConfig> {
        static bool decode(const Node& node, FieldConfig& rhs) {
            if (!node["name"]) {
                throw ConfigError("Missing required field 'name' for aggregation field.", "fields");
            }
            if (!node["reduce"]) {
                throw ConfigError("Missing required field 'reduce' for aggregation field.", "fields");
            }
            rhs.name = node["name"].as<std::string>();
            rhs.reduce = parse_reduce_kind(node["reduce"].as<std::string>());
            if (node["source"]) {
                rhs.source = node["source"].as<std::string>();
            } else if (rhs.reduce != ReduceKind::COUNT) {
                rhs.source = rhs.name;
            }
            return true;
        }
    };


    template<>
    struct convert<AggregationConfig> {
        static bool decode(const Node& node, AggregationConfig& rhs) {
            if (!node["name"]) {
                throw ConfigError("Missing required field 'name' in AggregationConfig.", "name");
            }
            if (!node["group_key"]) {
                throw ConfigError("Missing required field 'group_key' in AggregationConfig.", "group_key");
            }
            if (!node["order_column"]) {
                throw ConfigError("Missing required field 'order_column' in AggregationConfig.", "order_column");
            }
            if (!node["fields"] || !node["fields"].IsSequence()) {
                throw ConfigError("Missing required sequence 'fields' in AggregationConfig.", "fields");
            }

            rhs.name = node["name"].as<std::string>();
            rhs.group_key = node["group_key"].as<std::string>();
            rhs.order_column = node["order_column"].as<std::string>();
            rhs.fields = node["fields"].as<std::vector<FieldConfig>>();
            if (node["filters"]) {
                rhs.filters = node["filters"].as<std::vector<FilterConfig>>();
            }
            if (node["aggregation_sample_size"]) {
                rhs.aggregation_sample_size = node["aggregation_sample_size"].as<size_t>();
            }
            if (node["deep_sample_size"]) {
                rhs.deep_sample_size = node["deep_sample_size"].as<size_t>();
            }
            return true;
        }
    };

} // namespace YAML

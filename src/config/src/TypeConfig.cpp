#include "TypeConfig.h"
#include <algorithm>
#include <cmath>
#include <unordered_set>
#include "ConfigError.h"


double ChecksumTolerance::allowed(double expected) const noexcept {
    return std::max(absolute, relative * std::fabs(expected));
}

bool ChecksumTolerance::within(double expected, double actual) const noexcept {
    return std::fabs(expected - actual) <= allowed(expected);
}

std::vector<std::string> TypeConfig::expected_columns() const {
    return column_names(columns);
}

const ColumnConfig* TypeConfig::find_column(const std::string& column_name) const {
    auto it = std::find_if(columns.begin(), columns.end(),
                           [&](const ColumnConfig& c) { return c.name == column_name; });
    return it == columns.end() ? nullptr : &(*it);
}

bool TypeConfig::is_null_token(std::string_view value) const {
    return std::find(null_tokens.begin(), null_tokens.end(), value) != null_tokens.end();
}

void TypeConfig::validate() const {
    if (name.empty()) {
        throw ConfigError("Type configuration requires a name", "name");
    }
    if (columns.empty()) {
        throw ConfigError("Type configuration '" + name + "' declares no columns", "columns");
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < columns.size(); ++i) {
        const auto& column = columns[i];
        const std::string path = "columns[" + std::to_string(i) + "]";
        if (column.name.empty()) {
            throw ConfigError("Column name must not be empty", path);
        }
        if (!seen.insert(column.name).second) {
            throw ConfigError("Duplicate column name: " + column.name, path);
        }
        if (column.type_tag == ColumnTypeTag::UNKNOWN || column.type_tag == ColumnTypeTag::BIGINT_LIST) {
            throw ConfigError("Column '" + column.name + "' must be integer, float or string", path + ".type");
        }
    }

    std::unordered_set<std::string> keys;
    for (const auto& key : key_columns) {
        if (!find_column(key)) {
            throw ConfigError("Key column '" + key + "' is not a declared column", "key_columns");
        }
        if (!keys.insert(key).second) {
            throw ConfigError("Duplicate key column: " + key, "key_columns");
        }
    }

    if (checksum_column) {
        const ColumnConfig* column = find_column(*checksum_column);
        if (!column) {
            throw ConfigError("Checksum column '" + *checksum_column + "' is not a declared column",
                              "checksum_column");
        }
        if (!column->is_numeric()) {
            throw ConfigError("Checksum column '" + *checksum_column + "' must be numeric", "checksum_column");
        }
    }

    if (default_sample_size == 0) {
        throw ConfigError("default_sample_size must be positive", "default_sample_size");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw ConfigError("Invalid delimiter", "delimiter");
    }
    if (checksum_tolerance.absolute < 0 || checksum_tolerance.relative < 0) {
        throw ConfigError("Checksum tolerance must not be negative", "checksum_tolerance");
    }
}

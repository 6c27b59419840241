#include "SchemaValidator.h"
#include "ConvertError.h"
#include "LogUtils.h"


void SchemaValidator::validate(const ColumnConfigVector& observed, const TypeConfig& type_config,
                               const std::string& source_path) {
    SchemaValidationError error(type_config.expected_columns(), column_names(observed), source_path);
    if (!error.missing().empty() || !error.extra().empty()) {
        throw error;
    }

    for (const auto& column : observed) {
        const ColumnConfig* declared = type_config.find_column(column.name);
        if (declared && declared->type_tag != column.type_tag) {
            throw SchemaValidationError(type_config.expected_columns(), column_names(observed), source_path,
                                        "column '" + column.name + "' is " + type_tag_name(column.type_tag) +
                                        ", declared " + type_tag_name(declared->type_tag));
        }
    }
    debugPrint("Schema of %s matches %s (%zu columns)\n",
               source_path.c_str(), type_config.name.c_str(), observed.size());
}

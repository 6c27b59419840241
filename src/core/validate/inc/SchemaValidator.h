#pragma once

#include <string>
#include "ColumnConfig.h"
#include "TypeConfig.h"


class SchemaValidator {
public:
    // Observed names must equal the declared set. Throws SchemaValidationError
    // listing missing and extra columns.
    static void validate(const ColumnConfigVector& observed, const TypeConfig& type_config,
                         const std::string& source_path);
};

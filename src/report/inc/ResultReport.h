#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "AggregationResult.h"
#include "ColumnConfig.h"
#include "ConversionResult.h"
#include "ConvertError.h"

using json = nlohmann::json;

void to_json(json& j, const ColumnConfig& column);
void to_json(json& j, const StreamingStats& stats);
void to_json(json& j, const ValidationResult& result);
void to_json(json& j, const ConversionResult& result);
void to_json(json& j, const AggregationValidationResult& result);
void to_json(json& j, const AggregationResult& result);
void to_json(json& j, const ConvertError& error);


// JSON summary of a run, written for callers that do not parse logs
class ResultReport {
public:
    // {"command", "status": "ok", "result"}
    template <typename T>
    static json success(const std::string& command, const T& result) {
        json report;
        report["command"] = command;
        report["status"] = result.is_valid() ? "ok" : "invalid";
        report["result"] = result;
        return report;
    }

    // {"command", "status": "error", "error"}
    static json failure(const std::string& command, const ConvertError& error);

    // Pretty printed; throws OutputWriteError
    static void write(const std::string& path, const json& report);
};

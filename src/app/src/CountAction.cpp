#include "CountAction.h"
#include <cstdio>
#include "LogUtils.h"
#include "ResultReport.h"
#include "RowCounter.h"


CountAction::CountAction(const ParameterContext& context) : report_path_(context.get_report_path()) {
    const auto& positional = context.get_positional();
    if (positional.size() != 1) {
        throw ConfigError("count expects SOURCE, got " + std::to_string(positional.size()) + " arguments", "command");
    }
    if (const auto& type_config = context.get_type_config()) {
        has_header_ = type_config->has_header;
        delimiter_ = type_config->delimiter;
    }
    source_path_ = positional[0];
}

void CountAction::execute() {
    json report;
    report["command"] = "count";

    try {
        row_count_ = RowCounter(has_header_, delimiter_).count(source_path_);
    } catch (const ConvertError& e) {
        if (!report_path_.empty()) {
            ResultReport::write(report_path_, ResultReport::failure("count", e));
        }
        throw;
    }

    infoPrint("%s: %ld data rows\n", source_path_.c_str(), static_cast<long>(row_count_));
    printf("%ld\n", static_cast<long>(row_count_));

    if (!report_path_.empty()) {
        report["status"] = "ok";
        report["result"] = {{"source_path", source_path_}, {"row_count", row_count_}};
        ResultReport::write(report_path_, report);
    }
}

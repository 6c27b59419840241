#include "ConvertAction.h"
#include "DatasetConverter.h"
#include "LogUtils.h"
#include "ResultReport.h"


ConvertAction::ConvertAction(const ParameterContext& context)
    : options_(context.get_options()), report_path_(context.get_report_path()) {
    if (!context.get_type_config()) {
        throw ConfigError("convert requires a dataset descriptor", "--config");
    }
    const auto& positional = context.get_positional();
    if (positional.size() != 2) {
        throw ConfigError("convert expects SOURCE and OUTPUT, got " + std::to_string(positional.size()) +
                          " arguments", "command");
    }
    type_config_ = *context.get_type_config();
    source_path_ = positional[0];
    output_path_ = positional[1];
}

void ConvertAction::execute() {
    infoPrint("Converting %s with descriptor '%s'\n", source_path_.c_str(), type_config_.name.c_str());

    try {
        DatasetConverter converter(type_config_, options_);
        result_ = converter.convert(source_path_, output_path_);
    } catch (const ConvertError& e) {
        if (!report_path_.empty()) {
            ResultReport::write(report_path_, ResultReport::failure("convert", e));
        }
        throw;
    }

    if (result_.validation) {
        const ValidationResult& v = *result_.validation;
        infoPrint("%s: %ld rows, row count %s, checksum %s, sample of %zu %s\n",
                  output_path_.c_str(), static_cast<long>(result_.row_count),
                  v.row_count_valid ? "ok" : "FAILED",
                  v.checksum_valid ? "ok" : "FAILED",
                  v.sample_size,
                  v.sample_valid ? "ok" : "FAILED");
    }

    if (!report_path_.empty()) {
        ResultReport::write(report_path_, ResultReport::success("convert", result_));
        infoPrint("Report written to %s\n", report_path_.c_str());
    }
}

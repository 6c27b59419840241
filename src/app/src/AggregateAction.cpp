#include "AggregateAction.h"
#include "GroupAggregator.h"
#include "LogUtils.h"
#include "ResultReport.h"


AggregateAction::AggregateAction(const ParameterContext& context)
    : options_(context.get_options()), report_path_(context.get_report_path()) {
    if (!context.get_aggregation_config()) {
        throw ConfigError("aggregate requires an aggregation descriptor", "--config");
    }
    const auto& positional = context.get_positional();
    if (positional.size() != 2) {
        throw ConfigError("aggregate expects SOURCE and OUTPUT, got " + std::to_string(positional.size()) +
                          " arguments", "command");
    }
    config_ = *context.get_aggregation_config();
    source_path_ = positional[0];
    output_path_ = positional[1];

    // --sample-size applies to both key samples
    if (options_.sample_size) {
        config_.aggregation_sample_size = *options_.sample_size;
        config_.deep_sample_size = *options_.sample_size;
    }
}

void AggregateAction::execute() {
    infoPrint("Aggregating %s by %s\n", source_path_.c_str(), config_.group_key.c_str());

    try {
        GroupAggregator aggregator(config_, options_);
        result_ = aggregator.aggregate(source_path_, output_path_);
    } catch (const ConvertError& e) {
        if (!report_path_.empty()) {
            ResultReport::write(report_path_, ResultReport::failure("aggregate", e));
        }
        throw;
    }

    if (!report_path_.empty()) {
        ResultReport::write(report_path_, ResultReport::success("aggregate", result_));
        infoPrint("Report written to %s\n", report_path_.c_str());
    }
}

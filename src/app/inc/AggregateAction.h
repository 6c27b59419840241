#pragma once

#include <string>
#include "ActionBase.h"
#include "ActionFactory.h"
#include "AggregationResult.h"


// pfconvert aggregate --config=AGGREGATION.yaml SOURCE OUTPUT
class AggregateAction : public ActionBase {
public:
    explicit AggregateAction(const ParameterContext& context);

    void execute() override;

    const AggregationResult& result() const { return result_; }

private:
    AggregationConfig config_;
    ConvertOptions options_;
    std::string source_path_;
    std::string output_path_;
    std::string report_path_;
    AggregationResult result_;

    // 注册 AggregateAction 到 ActionFactory
    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "aggregate",
            [](const ParameterContext& context) {
                return std::make_unique<AggregateAction>(context);
            });
        return true;
    }();
};

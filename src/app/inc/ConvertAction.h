#pragma once

#include <string>
#include "ActionBase.h"
#include "ActionFactory.h"
#include "ConversionResult.h"


// pfconvert convert --config=TYPE.yaml SOURCE OUTPUT
class ConvertAction : public ActionBase {
public:
    explicit ConvertAction(const ParameterContext& context);

    void execute() override;

    const ConversionResult& result() const { return result_; }

private:
    TypeConfig type_config_;
    ConvertOptions options_;
    std::string source_path_;
    std::string output_path_;
    std::string report_path_;
    ConversionResult result_;

    // 注册 ConvertAction 到 ActionFactory
    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "convert",
            [](const ParameterContext& context) {
                return std::make_unique<ConvertAction>(context);
            });
        return true;
    }();
};

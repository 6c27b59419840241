#pragma once

#include <cstdint>
#include <string>
#include "ActionBase.h"
#include "ActionFactory.h"


// pfconvert count [--config=TYPE.yaml] SOURCE
class CountAction : public ActionBase {
public:
    explicit CountAction(const ParameterContext& context);

    void execute() override;

    int64_t row_count() const { return row_count_; }

private:
    bool has_header_ = true;
    char delimiter_ = ',';
    std::string source_path_;
    std::string report_path_;
    int64_t row_count_ = 0;

    inline static bool registered_ = []() {
        ActionFactory::instance().register_action(
            "count",
            [](const ParameterContext& context) {
                return std::make_unique<CountAction>(context);
            });
        return true;
    }();
};

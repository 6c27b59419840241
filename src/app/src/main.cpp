#include <cstdio>
#include <exception>
#include "AggregateAction.h"
#include "ConvertAction.h"
#include "CountAction.h"
#include "ConvertError.h"
#include "LogUtils.h"
#include "StringUtils.h"

namespace {

    constexpr int EXIT_ENGINE_ERROR = 1;
    constexpr int EXIT_USAGE_ERROR = 2;

    void report_config_error(const ConfigError& e) {
        errorPrint("%s\n", e.what());
        if (!e.suggestions.empty()) {
            errorPrint("Expected one of: %s\n", StringUtils::join(e.suggestions, ", ").c_str());
        }
    }

}

int main(int argc, char* argv[]) {
    ParameterContext context;
    try {
        context.init(argc, argv);
    } catch (const ConfigError& e) {
        report_config_error(e);
        fprintf(stderr, "%s", ParameterContext::usage().c_str());
        return EXIT_USAGE_ERROR;
    }

    if (context.is_help()) {
        printf("%s", ParameterContext::usage().c_str());
        return 0;
    }
    if (context.get_command().empty()) {
        fprintf(stderr, "%s", ParameterContext::usage().c_str());
        return EXIT_USAGE_ERROR;
    }

    LogUtils::set_debug(context.is_debug());
    try {
        if (!context.get_log_file().empty()) {
            LogUtils::open_result_file(context.get_log_file());
        }

        auto action = ActionFactory::instance().create_action(context.get_command(), context);
        action->execute();
    } catch (const ConfigError& e) {
        report_config_error(e);
        LogUtils::close_result_file();
        return EXIT_USAGE_ERROR;
    } catch (const ConvertError& e) {
        errorPrint("%s: %s\n", error_kind_name(e.kind), e.what());
        LogUtils::close_result_file();
        return EXIT_ENGINE_ERROR;
    } catch (const std::exception& e) {
        errorPrint("%s\n", e.what());
        LogUtils::close_result_file();
        return EXIT_ENGINE_ERROR;
    }

    LogUtils::close_result_file();
    return 0;
}

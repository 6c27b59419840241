#pragma once

#include "ConfigParser.h"

#include <yaml-cpp/yaml.h>
#include <unordered_map>
#include <vector>
#include <string>
#include <optional>


class ParameterContext {
public:
    ParameterContext() = default;

    // Command line, then YAML named by --config, then environment and
    // command line overrides on top of the YAML options
    void init(int argc, char* argv[]);

    // 合并参数来源
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml_file(const std::string& path);

    const std::string& get_command() const { return command_; }
    const std::vector<std::string>& get_positional() const { return positional_; }
    const std::string& get_config_path() const { return config_path_; }
    const std::string& get_report_path() const { return report_path_; }
    const std::string& get_log_file() const { return log_file_; }
    bool is_debug() const { return debug_; }
    bool is_help() const { return help_; }

    const ConvertOptions& get_options() const { return options_; }
    const std::optional<TypeConfig>& get_type_config() const { return type_config_; }
    const std::optional<AggregationConfig>& get_aggregation_config() const { return aggregation_config_; }

    static std::string usage();

private:
    std::string command_;
    std::vector<std::string> positional_;
    std::string config_path_;
    std::string report_path_;
    std::string log_file_;
    bool debug_ = false;
    bool help_ = false;

    ConvertOptions options_;
    std::optional<TypeConfig> type_config_;
    std::optional<AggregationConfig> aggregation_config_;

    // 命令行和环境变量存储
    std::unordered_map<std::string, std::string> cli_params_;
    std::unordered_map<std::string, std::string> env_params_;

    void apply_overrides(const std::unordered_map<std::string, std::string>& params);
};

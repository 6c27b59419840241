#include "ParameterContext.h"
#include <algorithm>
#include <cstdlib>
#include <sstream>
#include "StringUtils.h"


namespace {

    size_t parse_size(const std::string& key, const std::string& value) {
        try {
            size_t pos = 0;
            long long parsed = std::stoll(value, &pos);
            if (pos != value.size() || parsed < 0) {
                throw std::invalid_argument(value);
            }
            return static_cast<size_t>(parsed);
        } catch (const std::logic_error&) {
            throw ConfigError("Invalid numeric value '" + value + "'", key);
        }
    }

    bool parse_bool(const std::string& key, const std::string& value) {
        std::string lower = StringUtils::to_lower(value);
        if (lower.empty() || lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
        if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
        throw ConfigError("Invalid boolean value '" + value + "'", key);
    }

    const std::vector<std::string> known_flags = {
        "--config", "--no-validate", "--sample-size", "--batch-size", "--seed",
        "--level", "--report", "--log-file", "--debug", "--help"
    };

}

void ParameterContext::init(int argc, char* argv[]) {
    merge_commandline(argc, argv);
    if (help_) {
        return;
    }
    if (!config_path_.empty()) {
        merge_yaml_file(config_path_);
    }
    merge_environment_vars();
    apply_overrides(env_params_);
    apply_overrides(cli_params_);
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            if (command_.empty()) {
                command_ = arg;
            } else {
                positional_.push_back(arg);
            }
            continue;
        }

        std::string key = arg;
        std::string value;
        auto pos = arg.find('=');
        if (pos != std::string::npos) {
            key = arg.substr(0, pos);
            value = arg.substr(pos + 1);
        }

        if (std::find(known_flags.begin(), known_flags.end(), key) == known_flags.end()) {
            ConfigError error("Unknown option: " + key, key);
            error.suggestions = known_flags;
            throw error;
        }
        cli_params_[key] = value;
    }

    // 映射命令行参数
    if (cli_params_.count("--help")) help_ = true;
    if (cli_params_.count("--config")) config_path_ = cli_params_["--config"];
    if (cli_params_.count("--report")) report_path_ = cli_params_["--report"];
    if (cli_params_.count("--log-file")) log_file_ = cli_params_["--log-file"];
    if (cli_params_.count("--debug")) debug_ = parse_bool("--debug", cli_params_["--debug"]);
    if (command_ == "help") help_ = true;
}

void ParameterContext::merge_environment_vars() {
    std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"PFCONVERT_BATCH_SIZE", "--batch-size"},
        {"PFCONVERT_SAMPLE_SIZE", "--sample-size"},
        {"PFCONVERT_SEED", "--seed"},
        {"PFCONVERT_LEVEL", "--level"},
        {"PFCONVERT_DEBUG", "--debug"}
    };

    for (const auto& [env_var, key] : env_mappings) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value) {
            env_params_[key] = env_value;
        }
    }
    if (env_params_.count("--debug") && !cli_params_.count("--debug")) {
        debug_ = parse_bool("PFCONVERT_DEBUG", env_params_["--debug"]);
    }
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    if (!config.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    if (config["group_key"]) {
        auto aggregation = config.as<AggregationConfig>();
        aggregation.validate();
        aggregation_config_ = std::move(aggregation);
    } else {
        auto type_config = config.as<TypeConfig>();
        type_config.validate();
        type_config_ = std::move(type_config);
    }

    if (config["options"]) {
        options_ = config["options"].as<ConvertOptions>();
    }
}

void ParameterContext::merge_yaml_file(const std::string& path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigError("Cannot open configuration file: " + path, "--config");
    } catch (const YAML::ParserException& e) {
        throw ConfigError("Malformed YAML in " + path + ": " + e.what(), "--config");
    }

    try {
        merge_yaml(config);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid configuration in " + path + ": " + e.what(), "--config");
    }
}

void ParameterContext::apply_overrides(const std::unordered_map<std::string, std::string>& params) {
    for (const auto& [key, value] : params) {
        if (key == "--no-validate") {
            options_.validate = !parse_bool(key, value);
        } else if (key == "--sample-size") {
            options_.sample_size = parse_size(key, value);
            if (*options_.sample_size == 0) {
                throw ConfigError("sample size must be positive", key);
            }
        } else if (key == "--batch-size") {
            options_.batch_size = parse_size(key, value);
            if (options_.batch_size == 0) {
                throw ConfigError("batch size must be positive", key);
            }
        } else if (key == "--seed") {
            options_.seed = parse_size(key, value);
        } else if (key == "--level") {
            size_t level = parse_size(key, value);
            if (level > static_cast<size_t>(ConvertOptions::MAX_COMPRESSION_LEVEL)) {
                throw ConfigError("compression level must be between 0 and " +
                                  std::to_string(ConvertOptions::MAX_COMPRESSION_LEVEL), key);
            }
            options_.compression_level = static_cast<int>(level);
        }
    }
}

std::string ParameterContext::usage() {
    std::ostringstream oss;
    oss << "Usage:\n"
        << "  pfconvert convert --config=TYPE.yaml [options] SOURCE OUTPUT\n"
        << "  pfconvert aggregate --config=AGGREGATION.yaml [options] SOURCE OUTPUT\n"
        << "  pfconvert count [--config=TYPE.yaml] SOURCE\n"
        << "\n"
        << "Options:\n"
        << "  --config=FILE        dataset or aggregation descriptor (YAML)\n"
        << "  --no-validate        skip the validation tiers\n"
        << "  --sample-size=N      rows (or keys) checked by the sample tier\n"
        << "  --batch-size=N       rows per batch (default 100000)\n"
        << "  --seed=N             seed for sample selection\n"
        << "  --level=N            ZSTD compression level 0-22, 0 for none (default 3)\n"
        << "  --report=FILE        write the result as JSON\n"
        << "  --log-file=FILE      mirror log lines into FILE\n"
        << "  --debug              verbose logging\n"
        << "\n"
        << "Environment: PFCONVERT_BATCH_SIZE, PFCONVERT_SAMPLE_SIZE, PFCONVERT_SEED,\n"
        << "             PFCONVERT_LEVEL, PFCONVERT_DEBUG\n";
    return oss.str();
}

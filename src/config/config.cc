#include "config.hpp"

#include <config_parser/config_parser.hpp>
#include <config_parser/config_parser_utils.hpp>

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <string>
#include <tuple>
#include <vector>

enum class ConfigVariableType {
    Bool,
    String,
};

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

std::string
patchy::config_get_directory() {
    return fmt::format("{}/patchy", sago::getConfigHome());
}

static ConfigLoadResult
config_load_file(const std::string& config_path, diffy::Value& config_table, diffy::ParseResult& load_result) {
    if (!diffy::cfg_load_file(config_path, load_result, config_table)) {
        if (load_result.kind == diffy::ParseErrorKind::File) {
            return ConfigLoadResult::DoesNotExist;
        }
        return ConfigLoadResult::Invalid;
    }

    return config_table.is_table() ? ConfigLoadResult::Ok : ConfigLoadResult::Invalid;
}

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

static void
config_sync_options(diffy::Value& config, const OptionVector& options) {
    for (const auto& [path, type, ptr] : options) {
        auto stored_value = config.lookup_value_by_path(path);
        if (!stored_value) {
            continue;
        }

        auto& value = stored_value->get();
        switch (type) {
            case ConfigVariableType::Bool: {
                if (value.is_bool()) {
                    *((bool*) ptr) = value.as_bool();
                } else {
                    fmt::print(stderr, "warning: config option '{}' should be a bool\n", path);
                }
            } break;
            case ConfigVariableType::String: {
                if (value.is_string()) {
                    *((std::string*) ptr) = value.as_string();
                } else {
                    fmt::print(stderr, "warning: config option '{}' should be a string\n", path);
                }
            } break;
        }
    }
}

bool
patchy::config_apply_options_from_file(const std::string& config_path, ProgramOptions& program_options) {
    diffy::ParseResult config_parse_result;
    diffy::Value config_file_table_value;
    switch (config_load_file(config_path, config_file_table_value, config_parse_result)) {
        case ConfigLoadResult::Ok:
            break;
        case ConfigLoadResult::Invalid: {
            fmt::print(stderr, "error: {}\n\twhile parsing: {}\n", config_parse_result.error, config_path);
            return false;
        }
        case ConfigLoadResult::DoesNotExist:
            return true;
    }

    std::string strategy = repr(program_options.strategy);

    // clang-format off
    const OptionVector options = {
        { "general.strategy",        ConfigVariableType::String, &strategy },
        { "general.verbose",         ConfigVariableType::Bool,   &program_options.verbose },
        { "general.fix_end_newline", ConfigVariableType::Bool,   &program_options.fix_end_newline },
    };
    // clang-format on

    config_sync_options(config_file_table_value, options);

    if (auto parsed = strategy_from_string(strategy); parsed != ApplyStrategy::kInvalid) {
        program_options.strategy = parsed;
    } else {
        fmt::print(stderr, "warning: unknown strategy '{}' in {}\n", strategy, config_path);
    }

    return true;
}

bool
patchy::config_apply_options(ProgramOptions& program_options) {
    const std::string config_file_name = "patchy.conf";
    const std::string config_root = config_get_directory();
    const std::string config_path = fmt::format("{}/{}", config_root, config_file_name);

    return config_apply_options_from_file(config_path, program_options);
}

#include <memory_mcp/config/config_loader.hpp>

#include <memory_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace memory_mcp {

namespace {

Error MakeConfigError(const std::string& message,
                      const std::string& path = "") {
    return Error{"ConfigLoader", path, message, std::nullopt,
                 ErrorCategory::Config};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    const std::string path(file_path);
    AppConfig config;

    try {
        YAML::Node root = YAML::LoadFile(path);
        if (root.IsNull()) {
            return Result<AppConfig, Error>::Ok(std::move(config));
        }
        if (!root.IsMap()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Config root must be a mapping", path));
        }

        if (root["memory_file"]) {
            config.memory_file = root["memory_file"].as<std::string>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_level"]) {
            auto level = ParseLogLevel(root["log_level"].as<std::string>());
            if (level.IsErr()) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError(level.Error(), path));
            }
            config.log_level = level.Value();
        }
        if (root["json_logs"]) {
            config.json_logs = root["json_logs"].as<bool>();
        }
        if (root["color"]) {
            const bool color = root["color"].as<bool>();
            config.color = color;
            config.no_color = !color;
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what()),
                            path));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program(kServerName, kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "MCP server exposing add_memory/get_memories over stdio, backed by an "
        "append-only markdown file.");

    program.add_argument("--memory-file")
        .help("Memory log file (default: memories.md in the working directory)");
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--log-file")
        .help("Write logs as JSON lines to this file instead of stderr");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--json-logs")
        .help("Log JSON lines to stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Log at info level")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--debug")
        .help("Log at debug level")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--memory-file")) {
        config.memory_file = *val;
        config.memory_file_given = true;
    }
    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (level.IsErr()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --log-level: " + level.Error()));
        }
        config.log_level = level.Value();
        config.log_level_given = true;
    }
    if (program.get<bool>("--verbose")) {
        if (static_cast<int>(config.log_level) > static_cast<int>(LogLevel::Info)) {
            config.log_level = LogLevel::Info;
        }
        config.log_level_given = true;
    }
    if (program.get<bool>("--debug")) {
        config.log_level = LogLevel::Debug;
        config.log_level_given = true;
    }
    if (program.get<bool>("--json-logs")) {
        config.json_logs = true;
    }
    if (program.get<bool>("--color")) {
        config.color = true;
    }
    if (program.get<bool>("--no-color")) {
        config.no_color = true;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    if (cli_overrides.memory_file_given) {
        merged.memory_file = cli_overrides.memory_file;
        merged.memory_file_given = true;
    }
    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.log_level_given) {
        merged.log_level = cli_overrides.log_level;
        merged.log_level_given = true;
    }
    if (cli_overrides.json_logs) {
        merged.json_logs = true;
    }
    if (cli_overrides.color) {
        merged.color = true;
        merged.no_color = false;
    }
    if (cli_overrides.no_color) {
        merged.no_color = true;
        merged.color = false;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.memory_file.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("memory_file must not be empty"));
    }

    std::error_code ec;
    if (std::filesystem::is_directory(config.memory_file, ec)) {
        return Result<void, Error>::Err(
            MakeConfigError("memory_file names a directory", config.memory_file));
    }

    if (config.log_file.has_value() && config.log_file->empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("log_file must not be empty when set"));
    }
    if (config.color && config.no_color) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --color and --no-color"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// LoadConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv) {
    return LoadFromCli(argc, argv)
        .AndThen([](AppConfig cli) -> Result<AppConfig, Error> {
            if (!cli.config_file.has_value()) {
                return Result<AppConfig, Error>::Ok(std::move(cli));
            }
            auto yaml = LoadFromYaml(*cli.config_file);
            if (yaml.IsErr()) {
                return yaml;
            }
            return Result<AppConfig, Error>::Ok(
                MergeConfigs(std::move(yaml).Value(), cli));
        })
        .AndThen([](AppConfig config) -> Result<AppConfig, Error> {
            auto valid = ValidateConfig(config);
            if (valid.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(valid).Error());
            }
            return Result<AppConfig, Error>::Ok(std::move(config));
        });
}

} // namespace memory_mcp

#pragma once

#include <memory_mcp/config/app_config.hpp>
#include <memory_mcp/core/result.hpp>

#include <string_view>

namespace memory_mcp {

// Parse a YAML config file into an AppConfig. Keys: memory_file, log_file,
// log_level, json_logs, color.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: values given on the command line replace those in
// yaml_base, including values equal to the defaults.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Reject configs the server cannot run with.
Result<void, Error> ValidateConfig(const AppConfig& config);

// CLI, then the YAML file named by --config (if any), merged and validated.
Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv);

} // namespace memory_mcp

#pragma once

#include <memory_mcp/core/log.hpp>

#include <optional>
#include <string>

namespace memory_mcp {

struct AppConfig {
    // Storage file for the memory log, relative to the working directory
    // unless absolute.
    std::string memory_file = "memories.md";
    std::optional<std::string> config_file;  // -c/--config, CLI only
    std::optional<std::string> log_file;     // JSON lines; stderr when unset
    LogLevel log_level = LogLevel::Warn;
    bool json_logs = false;
    bool color = false;
    bool no_color = false;

    // Set by LoadFromCli when the value was given on the command line, even
    // if it equals the default. MergeConfigs overrides on these.
    bool memory_file_given = false;
    bool log_level_given = false;
};

} // namespace memory_mcp

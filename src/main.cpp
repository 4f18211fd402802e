#include <memory_mcp/config/config_loader.hpp>
#include <memory_mcp/core/log.hpp>
#include <memory_mcp/core/terminal.hpp>
#include <memory_mcp/core/version.hpp>
#include <memory_mcp/mcp/mcp_server.hpp>
#include <memory_mcp/mcp/memory_tools.hpp>
#include <memory_mcp/memory/memory_store.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

constexpr int kExitSuccess = 0;

// Check for --version anywhere on the command line.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << memory_mcp::kServerName << " "
                      << memory_mcp::kVersion << "\n";
            return true;
        }
    }
    return false;
}

void PrintError(const memory_mcp::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

// stdout is reserved for protocol messages, so every sink writes elsewhere.
memory_mcp::Result<std::unique_ptr<memory_mcp::ILogSink>, memory_mcp::Error>
MakeLogSink(const memory_mcp::AppConfig& config) {
    using namespace memory_mcp;
    using SinkResult = Result<std::unique_ptr<ILogSink>, Error>;

    if (config.log_file.has_value()) {
        auto file_sink = FileSink::Open(*config.log_file);
        if (file_sink.IsErr()) {
            return SinkResult::Err(std::move(file_sink).Error());
        }
        return SinkResult::Ok(std::move(file_sink).Value());
    }
    if (config.json_logs) {
        return SinkResult::Ok(std::make_unique<JsonSink>(std::cerr));
    }
    return SinkResult::Ok(std::make_unique<ColorConsoleSink>(
        ResolveLogColor(config.color, config.no_color)));
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace memory_mcp;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    auto loaded = LoadConfig(argc, argv);
    if (loaded.IsErr()) {
        PrintError(loaded.Error());
        return loaded.Error().ExitCode();
    }
    const auto config = std::move(loaded).Value();

    auto sink = MakeLogSink(config);
    if (sink.IsErr()) {
        PrintError(sink.Error());
        return sink.Error().ExitCode();
    }
    InitGlobalLogger(std::move(sink).Value(), config.log_level);

    LogInfo("main", std::string(kServerName) + " " + kVersion +
                    " storing memories in " + config.memory_file);
    if (IsStdinTty()) {
        LogWarn("main", "stdin is a terminal; expecting one JSON-RPC message per line");
    }

    MemoryStore store(config.memory_file);

    ToolRegistry registry;
    RegisterMemoryTools(registry, store);

    // Blocks until EOF on stdin.
    McpServer server(std::move(registry));
    server.Run();

    return kExitSuccess;
}

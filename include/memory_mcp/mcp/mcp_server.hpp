#pragma once

#include <memory_mcp/core/result.hpp>
#include <memory_mcp/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace memory_mcp {

// JSON-RPC 2.0 error codes.
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;

/// Newest first. The first entry is the answer for unknown peer versions.
inline constexpr const char* kSupportedProtocolVersions[] = {
    "2025-06-18",
    "2025-03-26",
    "2024-11-05",
};

enum class ServerState {
    Uninitialized,
    Ready,
};

// ---------------------------------------------------------------------------
// McpServer — MCP server over newline-delimited JSON-RPC 2.0 on stdio.
//
// Methods:
//   - initialize
//   - ping
//   - tools/list
//   - tools/call
//   - notifications/* (no response)
//
// The server moves to Ready on the first initialize and stays there. Requests
// that arrive before initialize are still served.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the server loop (blocks until EOF on the input stream).
    void Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] ServerState State() const noexcept { return state_; }

    /// JSON-RPC error code used for a tool failure of the given category.
    [[nodiscard]] static int ErrorCodeFor(ErrorCategory category) noexcept;

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id) const;
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id) const;

    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeToolError(const nlohmann::json& id,
                                        const Error& error);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    void Send(const nlohmann::json& message);

    ToolRegistry registry_;
    std::istream& in_;
    std::ostream& out_;
    ServerState state_ = ServerState::Uninitialized;
};

} // namespace memory_mcp

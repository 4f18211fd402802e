#pragma once

#include <memory_mcp/core/result.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace memory_mcp {

// ---------------------------------------------------------------------------
// ToolSchema — what tools/list advertises for one tool.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult — successful tool output as MCP content blocks.
// ---------------------------------------------------------------------------
struct ToolResult {
    nlohmann::json content = nlohmann::json::array();

    /// A result holding a single {"type": "text"} block.
    static ToolResult Text(std::string text);
};

// Failures carry ErrorCategory::UnknownTool, InvalidArguments or
// InternalFailure; McpServer turns them into JSON-RPC error objects.
using ToolOutcome = Result<ToolResult, Error>;

using ToolHandler = std::function<ToolOutcome(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry — ordered catalog of tools plus name-keyed dispatch.
//
// Tools() preserves registration order, which is the order peers see.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    /// Throws std::logic_error if a tool with the same name is registered twice.
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    /// Run a tool. Unknown names yield UnknownTool; exceptions escaping a
    /// handler are reported as InternalFailure.
    [[nodiscard]] ToolOutcome Execute(const std::string& name,
                                      const nlohmann::json& arguments) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace memory_mcp

#include <memory_mcp/mcp/tool_registry.hpp>

#include <memory_mcp/core/log.hpp>

#include <stdexcept>

namespace memory_mcp {

ToolResult ToolResult::Text(std::string text) {
    return ToolResult{
        nlohmann::json::array({{{"type", "text"}, {"text", std::move(text)}}})};
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    if (HasTool(name)) {
        throw std::logic_error("Tool registered twice: " + name);
    }
    schemas_.push_back({name, description, input_schema});
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolOutcome ToolRegistry::Execute(const std::string& name,
                                  const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return ToolOutcome::Err(Error{"CallTool", "", "Unknown tool: " + name,
                                      std::nullopt, ErrorCategory::UnknownTool});
    }

    try {
        return it->second(arguments);
    } catch (const std::exception& e) {
        LogError("mcp", "Tool '" + name + "' threw: " + e.what());
        return ToolOutcome::Err(Error{"CallTool", "",
                                      std::string("Tool error: ") + e.what(),
                                      std::nullopt,
                                      ErrorCategory::InternalFailure});
    }
}

} // namespace memory_mcp

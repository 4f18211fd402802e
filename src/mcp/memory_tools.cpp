#include <memory_mcp/mcp/memory_tools.hpp>

#include <memory_mcp/core/log.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace memory_mcp {

namespace {

constexpr const char* kLogComponent = "tools";

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

ToolOutcome InvalidArguments(const std::string& msg) {
    return ToolOutcome::Err(Error{"CallTool", "", "Invalid parameters: " + msg,
                                  std::nullopt,
                                  ErrorCategory::InvalidArguments});
}

// Store errors are surfaced to the peer as InternalFailure; the I/O detail
// stays in the message.
ToolOutcome StoreFailure(const std::string& what, const Error& store_error) {
    LogError(kLogComponent, what + ": " + store_error.ToString());
    return ToolOutcome::Err(Error{store_error.operation, store_error.path,
                                  what + ": " + store_error.message,
                                  store_error.os_error,
                                  ErrorCategory::InternalFailure});
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

nlohmann::json AddMemorySchema() {
    return MakeSchema(
        {{"content", StringProp("The content to store in memory")}},
        nlohmann::json::array({"content"}));
}

nlohmann::json GetMemoriesSchema() {
    return MakeSchema(nlohmann::json::object(), nlohmann::json::array());
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// add_memory — empty and whitespace-only content is stored as given.
ToolOutcome HandleAddMemory(IMemoryStore& store, const nlohmann::json& args) {
    if (!args.is_object()) {
        return InvalidArguments(std::string("arguments must be an object, got ") +
                                args.type_name());
    }
    if (!args.contains("content")) {
        return InvalidArguments("missing field `content`");
    }
    const auto& content = args["content"];
    if (!content.is_string()) {
        return InvalidArguments(std::string("field `content` must be a string, got ") +
                                content.type_name());
    }

    auto appended = store.Append(content.get_ref<const std::string&>());
    if (appended.IsErr()) {
        return StoreFailure("Failed to save memory", appended.Error());
    }

    LogInfo(kLogComponent, "Stored memory (" +
                           std::to_string(content.get_ref<const std::string&>().size()) +
                           " bytes)");
    return ToolOutcome::Ok(ToolResult::Text(kMemorySavedMessage));
}

// get_memories — arguments are ignored.
ToolOutcome HandleGetMemories(IMemoryStore& store, const nlohmann::json& /*args*/) {
    auto memories = store.ReadAll();
    if (memories.IsErr()) {
        return StoreFailure("Failed to retrieve memories", memories.Error());
    }
    return ToolOutcome::Ok(ToolResult::Text(std::move(memories).Value()));
}

// ---------------------------------------------------------------------------
// Catalog — advertised in this order.
// ---------------------------------------------------------------------------

struct MemoryToolEntry {
    const char* name;
    const char* description;
    nlohmann::json (*schema)();
    ToolOutcome (*handler)(IMemoryStore&, const nlohmann::json&);
};

const MemoryToolEntry kMemoryTools[] = {
    {kAddMemoryTool,
     "Add a new memory about the user. Call this whenever the user shares "
     "preferences, facts about themselves, or explicitly asks you to remember "
     "something.",
     &AddMemorySchema, &HandleAddMemory},
    {kGetMemoriesTool,
     "Retrieve all stored memories about the user.",
     &GetMemoriesSchema, &HandleGetMemories},
};

} // anonymous namespace

void RegisterMemoryTools(ToolRegistry& registry, IMemoryStore& store) {
    for (const auto& tool : kMemoryTools) {
        auto handler = tool.handler;
        registry.Register(tool.name, tool.description, tool.schema(),
            [&store, handler](const nlohmann::json& args) -> ToolOutcome {
                return handler(store, args);
            });
    }
}

} // namespace memory_mcp

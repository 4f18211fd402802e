#pragma once

#include <memory_mcp/mcp/tool_registry.hpp>
#include <memory_mcp/memory/i_memory_store.hpp>

namespace memory_mcp {

inline constexpr const char* kAddMemoryTool = "add_memory";
inline constexpr const char* kGetMemoriesTool = "get_memories";

/// Text returned by add_memory once the entry is on disk.
inline constexpr const char* kMemorySavedMessage = "Memory saved successfully.";

// Register add_memory and get_memories, in that order, against the given
// store. The store must outlive the registry.
void RegisterMemoryTools(ToolRegistry& registry, IMemoryStore& store);

} // namespace memory_mcp

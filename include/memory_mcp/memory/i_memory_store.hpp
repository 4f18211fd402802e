#pragma once

#include <memory_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace memory_mcp {

/// Returned by ReadAll() when nothing has been stored yet.
inline constexpr const char* kNoMemoriesSentinel = "No memories found yet.";

// ---------------------------------------------------------------------------
// IMemoryStore — append-only log of timestamped notes.
//
// Failures are returned as Result errors with ErrorCategory::IoFailure.
// ---------------------------------------------------------------------------
class IMemoryStore {
public:
    virtual ~IMemoryStore() = default;

    IMemoryStore() = default;
    IMemoryStore(const IMemoryStore&) = delete;
    IMemoryStore& operator=(const IMemoryStore&) = delete;
    IMemoryStore(IMemoryStore&&) = delete;
    IMemoryStore& operator=(IMemoryStore&&) = delete;

    /// Append one entry. Any text is accepted, including empty and
    /// whitespace-only strings.
    [[nodiscard]] virtual Result<void, Error> Append(std::string_view text) = 0;

    /// The whole log verbatim, or kNoMemoriesSentinel when the log is missing
    /// or holds only whitespace.
    [[nodiscard]] virtual Result<std::string, Error> ReadAll() = 0;
};

} // namespace memory_mcp

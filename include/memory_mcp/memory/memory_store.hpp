#pragma once

#include <memory_mcp/memory/i_memory_store.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace memory_mcp {

/// Default storage file, resolved against the working directory.
inline constexpr const char* kDefaultMemoryFile = "memories.md";

// ---------------------------------------------------------------------------
// MemoryStore — IMemoryStore backed by a single markdown file.
//
// Each entry is written as:
//
//   ## 2024-02-29 13:05 UTC
//   <text>
//   <blank line>
//
// The file is only ever opened in append mode; existing bytes are never
// rewritten. Each entry is a single write.
// ---------------------------------------------------------------------------
class MemoryStore : public IMemoryStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit MemoryStore(std::string path = kDefaultMemoryFile,
                         Clock clock = std::chrono::system_clock::now);

    [[nodiscard]] Result<void, Error> Append(std::string_view text) override;
    [[nodiscard]] Result<std::string, Error> ReadAll() override;

    [[nodiscard]] const std::string& Path() const noexcept { return path_; }

    /// Render one entry exactly as Append() writes it.
    [[nodiscard]] static std::string RenderEntry(std::int64_t unix_seconds,
                                                 std::string_view text);

private:
    std::string path_;
    Clock clock_;
    std::mutex mutex_;
};

} // namespace memory_mcp

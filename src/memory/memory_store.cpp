#include <memory_mcp/memory/memory_store.hpp>

#include <memory_mcp/core/log.hpp>
#include <memory_mcp/memory/timestamp.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <system_error>

namespace memory_mcp {

namespace {

constexpr const char* kLogComponent = "memory";

bool IsBlank(const std::string& content) {
    return std::all_of(content.begin(), content.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

Error IoError(const std::string& operation, const std::string& path,
              const std::error_code& ec) {
    return Error{operation, path, ec.message(), ec.value(),
                 ErrorCategory::IoFailure};
}

// Size to truncate back to if an append fails part way. nullopt when the
// path is not a regular file (or cannot be inspected), so nothing is undone.
std::optional<std::uintmax_t> SizeBeforeAppend(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return 0;
    }
    if (ec || !fs::is_regular_file(status)) {
        return std::nullopt;
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return size;
}

} // anonymous namespace

MemoryStore::MemoryStore(std::string path, Clock clock)
    : path_(std::move(path)), clock_(std::move(clock)) {}

std::string MemoryStore::RenderEntry(std::int64_t unix_seconds,
                                     std::string_view text) {
    std::string entry;
    entry.reserve(text.size() + 32);
    entry += "## ";
    entry += FormatTimestamp(unix_seconds);
    entry += '\n';
    entry += text;
    entry += "\n\n";
    return entry;
}

Result<void, Error> MemoryStore::Append(std::string_view text) {
    const auto entry = RenderEntry(ToUnixSeconds(clock_()), text);

    std::lock_guard<std::mutex> lock(mutex_);

    const auto rollback_size = SizeBeforeAppend(path_);

    errno = 0;
    std::ofstream out(path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!out.is_open()) {
        auto error = Error::FromErrno("AppendMemory", path_, errno);
        LogError(kLogComponent, error.ToString());
        return Result<void, Error>::Err(std::move(error));
    }

    out.write(entry.data(), static_cast<std::streamsize>(entry.size()));
    out.flush();
    if (!out) {
        auto error = Error::FromErrno("AppendMemory", path_, errno);
        LogError(kLogComponent, error.ToString());

        // Close first so no buffered bytes land after the truncation.
        out.close();
        if (rollback_size.has_value()) {
            std::error_code ec;
            std::filesystem::resize_file(path_, *rollback_size, ec);
            if (ec) {
                LogError(kLogComponent, "Could not drop partial entry from " +
                                        path_ + ": " + ec.message());
            }
        }
        return Result<void, Error>::Err(std::move(error));
    }

    LogDebug(kLogComponent, "Appended " + std::to_string(text.size()) +
                            " bytes to " + path_);
    return Result<void, Error>::Ok();
}

Result<std::string, Error> MemoryStore::ReadAll() {
    namespace fs = std::filesystem;

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    const auto status = fs::status(path_, ec);
    if (status.type() == fs::file_type::not_found) {
        LogDebug(kLogComponent, path_ + " does not exist yet");
        return Result<std::string, Error>::Ok(kNoMemoriesSentinel);
    }
    if (ec) {
        return Result<std::string, Error>::Err(IoError("ReadMemories", path_, ec));
    }
    if (fs::is_directory(status)) {
        return Result<std::string, Error>::Err(IoError(
            "ReadMemories", path_,
            std::make_error_code(std::errc::is_a_directory)));
    }

    errno = 0;
    std::ifstream in(path_, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        auto error = Error::FromErrno("ReadMemories", path_, errno);
        LogError(kLogComponent, error.ToString());
        return Result<std::string, Error>::Err(std::move(error));
    }

    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    if (in.bad()) {
        auto error = Error::FromErrno("ReadMemories", path_, errno);
        LogError(kLogComponent, error.ToString());
        return Result<std::string, Error>::Err(std::move(error));
    }

    if (IsBlank(content)) {
        return Result<std::string, Error>::Ok(kNoMemoriesSentinel);
    }
    return Result<std::string, Error>::Ok(std::move(content));
}

} // namespace memory_mcp

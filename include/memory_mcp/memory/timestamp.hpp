#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace memory_mcp {

// ---------------------------------------------------------------------------
// CivilTime — a UTC calendar instant at minute resolution.
// ---------------------------------------------------------------------------
struct CivilTime {
    std::int64_t year = 1970;
    int month = 1;   // 1..12
    int day = 1;     // 1..31
    int hour = 0;    // 0..23
    int minute = 0;  // 0..59

    bool operator==(const CivilTime& other) const {
        return year == other.year && month == other.month &&
               day == other.day && hour == other.hour &&
               minute == other.minute;
    }
};

/// Gregorian rule: divisible by 4, except centuries not divisible by 400.
[[nodiscard]] constexpr bool IsLeapYear(std::int64_t year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

/// Convert seconds since 1970-01-01T00:00:00Z to a UTC calendar instant.
/// Integer arithmetic only; negative inputs map to dates before 1970.
[[nodiscard]] CivilTime CivilFromUnixSeconds(std::int64_t unix_seconds) noexcept;

/// Render the header used for memory entries: "YYYY-MM-DD HH:MM UTC".
[[nodiscard]] std::string FormatTimestamp(std::int64_t unix_seconds);

/// Whole seconds since the Unix epoch, rounded toward negative infinity.
[[nodiscard]] std::int64_t ToUnixSeconds(
    std::chrono::system_clock::time_point time_point) noexcept;

} // namespace memory_mcp

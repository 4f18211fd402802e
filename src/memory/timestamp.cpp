#include <memory_mcp/memory/timestamp.hpp>

#include <cstdio>

namespace memory_mcp {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;
constexpr std::int64_t kDaysPer400Years = 146097;
// Days from 0000-03-01 to 1970-01-01 in the proleptic Gregorian calendar.
constexpr std::int64_t kEpochShiftDays = 719468;

std::int64_t FloorDiv(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

} // anonymous namespace

// Years are counted from March so that the leap day is the last day of the
// year; this keeps the month table free of leap-year special cases.
CivilTime CivilFromUnixSeconds(std::int64_t unix_seconds) noexcept {
    const std::int64_t days = FloorDiv(unix_seconds, kSecondsPerDay);
    const std::int64_t secs_of_day = unix_seconds - days * kSecondsPerDay;

    const std::int64_t z = days + kEpochShiftDays;
    const std::int64_t era = FloorDiv(z, kDaysPer400Years);
    const std::int64_t doe = z - era * kDaysPer400Years;                    // [0, 146096]
    const std::int64_t yoe =
        (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;              // [0, 399]
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);       // [0, 365]
    const std::int64_t mp = (5 * doy + 2) / 153;                            // [0, 11]

    CivilTime civil;
    civil.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    civil.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    civil.year = yoe + era * 400 + (civil.month <= 2 ? 1 : 0);
    civil.hour = static_cast<int>(secs_of_day / 3600);
    civil.minute = static_cast<int>((secs_of_day % 3600) / 60);
    return civil;
}

std::string FormatTimestamp(std::int64_t unix_seconds) {
    const auto civil = CivilFromUnixSeconds(unix_seconds);

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02d-%02d %02d:%02d UTC",
                  static_cast<long long>(civil.year), civil.month, civil.day,
                  civil.hour, civil.minute);
    return buffer;
}

std::int64_t ToUnixSeconds(
    std::chrono::system_clock::time_point time_point) noexcept {
    return std::chrono::floor<std::chrono::seconds>(time_point)
        .time_since_epoch()
        .count();
}

} // namespace memory_mcp

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tabula {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Instant in microseconds since 1970-01-01T00:00:00Z (Unix epoch).
///
/// Microsecond resolution keeps the full 0001-01-01 .. 9999-12-31 range
/// representable, which the sentinel values below require.
struct Timestamp {
    std::int64_t micros = 0;
    auto operator<=>(const Timestamp&) const = default;
};

inline constexpr std::int64_t kMicrosPerDay = std::int64_t{86'400} * 1'000'000;

/// Build a Date from a proleptic Gregorian year/month/day.
[[nodiscard]] constexpr auto make_date(int y, unsigned m, unsigned d) -> Date {
    using namespace std::chrono;
    auto day_point = sys_days{year{y} / month{m} / day{d}};
    return Date{static_cast<std::int32_t>(day_point.time_since_epoch().count())};
}

/// First instant of `date`.
[[nodiscard]] constexpr auto start_of_day(Date date) noexcept -> Timestamp {
    return Timestamp{static_cast<std::int64_t>(date.days) * kMicrosPerDay};
}

/// Last representable instant of `date`.
[[nodiscard]] constexpr auto end_of_day(Date date) noexcept -> Timestamp {
    return Timestamp{start_of_day(date).micros + kMicrosPerDay - 1};
}

/// Calendar day containing `ts` (floors towards negative infinity).
[[nodiscard]] constexpr auto day_of(Timestamp ts) noexcept -> Date {
    auto days = ts.micros / kMicrosPerDay;
    if (ts.micros % kMicrosPerDay < 0) {
        --days;
    }
    return Date{static_cast<std::int32_t>(days)};
}

/// "No value recorded": 0001-01-01T00:00:00.
inline constexpr Timestamp kSentinelMin = start_of_day(make_date(1, 1, 1));

/// "Never retires": 9999-12-31T00:00:00. Anything at or after it is open-ended.
inline constexpr Timestamp kSentinelMax = start_of_day(make_date(9999, 12, 31));

/// Current wall-clock instant (UTC).
[[nodiscard]] auto now_utc() -> Timestamp;

/// Current calendar day (UTC).
[[nodiscard]] auto today_utc() -> Date;

/// Parse a timestamp.
///
/// Accepted forms:
///   - ISO-8601 `YYYY-MM-DD`, optionally followed by `T` or a space and
///     `HH:MM`, `HH:MM:SS` or `HH:MM:SS.ffffff`
///   - legacy day-of-year decimal `YYYYDDD.fraction`, where the fraction is the
///     elapsed share of the day (`2025043.5` is 2025-02-12 12:00)
[[nodiscard]] auto parse_timestamp(std::string_view text) -> std::optional<Timestamp>;

/// Parse a calendar date (`YYYY-MM-DD` or any form accepted by parse_timestamp).
[[nodiscard]] auto parse_date(std::string_view text) -> std::optional<Date>;

/// `YYYY-MM-DD`.
[[nodiscard]] auto format_date(Date date) -> std::string;

/// `YYYY-MM-DD` for midnight, otherwise `YYYY-MM-DD HH:MM:SS` (with `.ffffff`
/// when sub-second digits are present).
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

}  // namespace tabula

namespace std {

template <>
struct hash<tabula::Date> {
    auto operator()(const tabula::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

template <>
struct hash<tabula::Timestamp> {
    auto operator()(const tabula::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.micros);
    }
};

}  // namespace std

#include <tabula/core/time.hpp>

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <cstdint>

namespace tabula {

namespace {

auto trim(std::string_view input) -> std::string_view {
    auto start = input.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = input.find_last_not_of(" \t\n\r");
    return input.substr(start, end - start + 1);
}

auto parse_fixed(std::string_view text, std::size_t pos, std::size_t len, int& out) -> bool {
    if (pos + len > text.size()) {
        return false;
    }
    for (std::size_t i = pos; i < pos + len; ++i) {
        if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
            return false;
        }
    }
    auto result = std::from_chars(text.data() + pos, text.data() + pos + len, out);
    return result.ec == std::errc();
}

auto valid_ymd(int y, int m, int d) -> bool {
    using namespace std::chrono;
    if (y < 1 || y > 9999) {
        return false;
    }
    year_month_day ymd{year{y}, month{static_cast<unsigned>(m)}, day{static_cast<unsigned>(d)}};
    return ymd.ok();
}

auto parse_iso(std::string_view text) -> std::optional<Timestamp> {
    int y = 0;
    int m = 0;
    int d = 0;
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    if (!parse_fixed(text, 0, 4, y) || !parse_fixed(text, 5, 2, m) || !parse_fixed(text, 8, 2, d)) {
        return std::nullopt;
    }
    if (!valid_ymd(y, m, d)) {
        return std::nullopt;
    }
    auto ts = start_of_day(make_date(y, static_cast<unsigned>(m), static_cast<unsigned>(d)));
    if (text.size() == 10) {
        return ts;
    }

    if (text[10] != 'T' && text[10] != ' ') {
        return std::nullopt;
    }
    auto tod = text.substr(11);
    // Trailing UTC designator is accepted; other offsets are not.
    if (!tod.empty() && tod.back() == 'Z') {
        tod.remove_suffix(1);
    }
    int hh = 0;
    int mm = 0;
    int ss = 0;
    if (tod.size() < 5 || tod[2] != ':' || !parse_fixed(tod, 0, 2, hh) ||
        !parse_fixed(tod, 3, 2, mm)) {
        return std::nullopt;
    }
    std::int64_t frac_micros = 0;
    if (tod.size() > 5) {
        if (tod[5] != ':' || !parse_fixed(tod, 6, 2, ss)) {
            return std::nullopt;
        }
        if (tod.size() > 8) {
            if (tod[8] != '.') {
                return std::nullopt;
            }
            auto digits = tod.substr(9);
            if (digits.empty() || digits.size() > 9) {
                return std::nullopt;
            }
            std::int64_t scale = 100'000;
            for (char ch : digits) {
                if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
                    return std::nullopt;
                }
                frac_micros += (ch - '0') * scale;
                scale /= 10;
            }
        }
    }
    if (hh > 23 || mm > 59 || ss > 59) {
        return std::nullopt;
    }
    ts.micros += ((static_cast<std::int64_t>(hh) * 60 + mm) * 60 + ss) * 1'000'000 + frac_micros;
    return ts;
}

auto parse_day_of_year(std::string_view text) -> std::optional<Timestamp> {
    auto dot = text.find('.');
    auto int_part = text.substr(0, dot);
    if (int_part.size() < 4 || int_part.size() > 7) {
        return std::nullopt;
    }
    std::int64_t packed = 0;
    auto [ptr, ec] = std::from_chars(int_part.data(), int_part.data() + int_part.size(), packed);
    if (ec != std::errc() || ptr != int_part.data() + int_part.size()) {
        return std::nullopt;
    }
    auto y = static_cast<int>(packed / 1000);
    auto yday = static_cast<int>(packed % 1000);
    if (y < 1 || y > 9999 || yday < 1 || yday > 366) {
        return std::nullopt;
    }
    auto leap = std::chrono::year{y}.is_leap();
    if (yday > (leap ? 366 : 365)) {
        return std::nullopt;
    }
    Date date{make_date(y, 1, 1).days + yday - 1};

    double fraction = 0.0;
    if (dot != std::string_view::npos) {
        auto frac_text = text.substr(dot);
        auto [fptr, fec] =
            std::from_chars(frac_text.data(), frac_text.data() + frac_text.size(), fraction,
                            std::chars_format::fixed);
        if (fec != std::errc() || fptr != frac_text.data() + frac_text.size()) {
            return std::nullopt;
        }
    }
    auto ts = start_of_day(date);
    ts.micros += static_cast<std::int64_t>(fraction * static_cast<double>(kMicrosPerDay));
    return ts;
}

}  // namespace

auto now_utc() -> Timestamp {
    using namespace std::chrono;
    auto since_epoch = duration_cast<microseconds>(system_clock::now().time_since_epoch());
    return Timestamp{since_epoch.count()};
}

auto today_utc() -> Date {
    return day_of(now_utc());
}

auto parse_timestamp(std::string_view text) -> std::optional<Timestamp> {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.find('-') != std::string_view::npos) {
        return parse_iso(text);
    }
    return parse_day_of_year(text);
}

auto parse_date(std::string_view text) -> std::optional<Date> {
    auto ts = parse_timestamp(text);
    if (!ts) {
        return std::nullopt;
    }
    return day_of(*ts);
}

auto format_date(Date date) -> std::string {
    using namespace std::chrono;
    sys_days day_point = sys_days{days{date.days}};
    year_month_day ymd{day_point};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto format_timestamp(Timestamp ts) -> std::string {
    auto date = day_of(ts);
    auto tod = ts.micros - start_of_day(date).micros;
    if (tod == 0) {
        return format_date(date);
    }
    auto secs = tod / 1'000'000;
    auto frac = tod % 1'000'000;
    auto out = fmt::format("{} {:02}:{:02}:{:02}", format_date(date), secs / 3600,
                           (secs / 60) % 60, secs % 60);
    if (frac != 0) {
        out += fmt::format(".{:06}", frac);
    }
    return out;
}

}  // namespace tabula

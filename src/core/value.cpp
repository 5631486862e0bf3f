#include <tabula/core/value.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cmath>

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

auto parse_double(std::string_view text) -> std::optional<double> {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    // from_chars rejects a leading '+', which strtod-style parsing accepts.
    if (text.front() == '+') {
        text.remove_prefix(1);
    }
    double out = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return out;
}

}  // namespace

auto is_blank(const Value& value) -> bool {
    if (is_null(value)) {
        return true;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return trim(*s).empty();
    }
    return false;
}

auto as_number(const Value& value) -> std::optional<double> {
    return std::visit(
        [](const auto& v) -> std::optional<double> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::int64_t>) {
                return static_cast<double>(v);
            } else if constexpr (std::is_same_v<T, double>) {
                return v;
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return static_cast<double>(v.micros);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return parse_double(v);
            } else {
                return std::nullopt;
            }
        },
        value);
}

auto to_display_string(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return {};
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v))
                    return "nan";
                if (std::isinf(v))
                    return v > 0 ? "inf" : "-inf";
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(v);
            } else {
                return v;
            }
        },
        value);
}

}  // namespace tabula

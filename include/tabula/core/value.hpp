#pragma once

#include <tabula/core/time.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace tabula {

enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Int,
    Double,
    String,
    Timestamp,
};

/// A single cell value. Alternative order matches ValueKind.
using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string, Timestamp>;

/// Versions of one field keyed by the instant they became effective.
using TemporalMap = std::map<Timestamp, Value>;

[[nodiscard]] inline auto kind_of(const Value& value) noexcept -> ValueKind {
    return static_cast<ValueKind>(value.index());
}

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

/// True for null and for strings that contain only whitespace.
[[nodiscard]] auto is_blank(const Value& value) -> bool;

/// Numeric reading of a value.
///
/// Ints, doubles and timestamps (as microseconds) are numeric. Strings are
/// numeric when the whole trimmed text parses as a floating-point number.
/// NaN is returned as-is; callers decide whether it counts.
[[nodiscard]] auto as_number(const Value& value) -> std::optional<double>;

/// Text used for filtering, grouping and string comparison.
///
/// Null renders as the empty string, booleans as `true`/`false`, doubles in
/// shortest round-trip form and timestamps via format_timestamp().
[[nodiscard]] auto to_display_string(const Value& value) -> std::string;

/// A stored field: either a plain value or a temporal value map.
struct FieldValue {
    std::variant<Value, TemporalMap> data;

    [[nodiscard]] static auto scalar(Value value) -> FieldValue {
        return FieldValue{.data = std::move(value)};
    }

    [[nodiscard]] static auto temporal(TemporalMap versions) -> FieldValue {
        return FieldValue{.data = std::move(versions)};
    }

    [[nodiscard]] auto is_temporal() const noexcept -> bool {
        return std::holds_alternative<TemporalMap>(data);
    }

    auto operator==(const FieldValue&) const -> bool = default;
};

}  // namespace tabula

#pragma once

#include <json/json.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tabula::state {

enum class SortDirection : std::uint8_t {
    None,
    Ascending,
    Descending,
};

[[nodiscard]] auto to_string(SortDirection direction) -> std::string_view;

struct SortSpec {
    std::optional<std::string> control_id;
    SortDirection direction = SortDirection::None;

    [[nodiscard]] auto active() const noexcept -> bool {
        return control_id.has_value() && direction != SortDirection::None;
    }

    auto operator==(const SortSpec&) const -> bool = default;
};

struct GroupSpec {
    bool enabled = false;
    std::optional<std::string> by;
    std::optional<std::string> sum_by;

    auto operator==(const GroupSpec&) const -> bool = default;
};

/// User-configurable sort/filter/group state of one view instance.
/// Default-constructed: no sort, no filters, grouping disabled.
struct TableState {
    SortSpec sort;
    /// Control id -> substring needle, matched case-insensitively.
    std::map<std::string, std::string> filters;
    GroupSpec group;

    auto operator==(const TableState&) const -> bool = default;
};

struct TableStateMeta {
    /// False when the raw input was missing or not an object.
    bool source_ok = false;
    std::vector<std::string> warnings;
};

struct MergedTableState {
    TableState state;
    TableStateMeta meta;
};

/// Sanitize raw table-state JSON onto the defaults.
///
/// Never fails. Each malformed field is replaced by its default and reported
/// as a warning. Filters keep non-empty trimmed needles; numbers and booleans
/// are stringified. Both `controlId`/`sumBy` and the legacy
/// `control_guid`/`sum_control_guid` spellings are read.
[[nodiscard]] auto merge_table_state(const Json::Value& raw) -> MergedTableState;

[[nodiscard]] auto to_json(const TableState& state) -> Json::Value;

/// Compact, key-sorted serialization; equal states give equal strings.
[[nodiscard]] auto canonical_json(const TableState& state) -> std::string;

}  // namespace tabula::state

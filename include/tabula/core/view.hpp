#pragma once

#include <tabula/core/record.hpp>

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tabula {

enum class ControlType : std::uint8_t {
    String,
    Number,
    Date,
    DateTime,
    Boolean,
    Dropdown,
};

[[nodiscard]] auto to_string(ControlType type) -> std::string_view;

/// Normalize a declared control type. Unknown or empty names fall back to
/// String; `text` and `base` are aliases of String, `int`/`float` of Number,
/// `bool` of Boolean.
[[nodiscard]] auto parse_control_type(std::string_view name) -> ControlType;

/// A column definition owned by the view origin.
struct Control {
    std::string id;
    FieldKey source;
    std::string label;
    ControlType type = ControlType::String;
    bool show = true;
    std::int64_t display_order = 0;
    std::optional<std::int64_t> width;
    /// Origin keys the engine does not interpret (`configs`, `searchable`,
    /// `filterType`, ...). Passed through to clients verbatim.
    Json::Value attributes{Json::objectValue};

    [[nodiscard]] auto is_system() const noexcept -> bool { return is_system_group(source.group); }
};

/// Immutable view definition as loaded from the view store.
struct ViewDefinition {
    std::string id;
    std::string name;
    std::string root_table;
    /// Control used when the table state carries no sort.
    std::optional<std::string> default_sort;
    bool filterable = true;
    bool sortable = true;
    /// Opt-in for callers to point the view at a different table.
    bool allow_table_override = false;
    std::vector<Control> controls;

    [[nodiscard]] auto find_control(std::string_view control_id) const -> const Control* {
        for (const auto& control : controls) {
            if (control.id == control_id) {
                return &control;
            }
        }
        return nullptr;
    }
};

}  // namespace tabula

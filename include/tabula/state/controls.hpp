#pragma once

#include <tabula/core/view.hpp>

#include <json/json.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tabula::state {

/// User-editable part of a control. Absent fields keep the origin value.
struct ControlOverride {
    std::optional<bool> show;
    std::optional<std::int64_t> display_order;
    std::optional<std::int64_t> width;

    auto operator==(const ControlOverride&) const -> bool = default;
};

/// Overrides keyed by control id.
using ControlOverrides = std::map<std::string, ControlOverride>;

/// Render-ready control: origin fields with user overrides applied.
struct EffectiveControl {
    Control control;
    /// Set for override entries whose origin control no longer exists.
    bool orphan = false;
};

struct ControlsMeta {
    std::size_t origin_count = 0;
    std::size_t source_count = 0;
    std::size_t effective_count = 0;
    std::size_t orphan_count = 0;
    /// True when every control would have been hidden and one was made visible.
    bool forced_visible = false;
};

struct MergedControls {
    std::vector<EffectiveControl> controls;
    ControlsMeta meta;
};

struct SanitizedOverrides {
    ControlOverrides overrides;
    std::vector<std::string> warnings;
};

/// Turn persisted or client-sent override JSON into typed overrides.
///
/// Never fails: entries that are not objects and fields of the wrong type are
/// dropped and reported in `warnings`.
[[nodiscard]] auto sanitize_control_overrides(const Json::Value& raw) -> SanitizedOverrides;

/// Merge origin controls with user overrides.
///
/// Origin order is kept; orphans follow in id order, hidden and at order zero
/// unless the override says otherwise. If no control ends up visible, the one
/// with the lowest display order (orphans included, first on ties) is
/// shown and `meta.forced_visible` is set.
[[nodiscard]] auto merge_controls(std::span<const Control> origin,
                                  const ControlOverrides& overrides) -> MergedControls;

/// Persistable override set: the user keys of every effective control, plus
/// orphan overrides that still carry at least one key.
[[nodiscard]] auto normalize_controls_source(const ControlOverrides& overrides,
                                             std::span<const EffectiveControl> effective)
    -> ControlOverrides;

[[nodiscard]] auto to_json(const ControlOverrides& overrides) -> Json::Value;

/// Origin attributes with the engine-owned keys written over them.
[[nodiscard]] auto to_json(const EffectiveControl& control) -> Json::Value;

}  // namespace tabula::state

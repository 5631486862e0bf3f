#include <tabula/state/controls.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <limits>

namespace tabula::state {

namespace {

auto read_int(const Json::Value& value) -> std::optional<std::int64_t> {
    if (value.isInt64()) {
        return value.asInt64();
    }
    if (value.isDouble()) {
        double d = value.asDouble();
        if (std::isfinite(d) && std::floor(d) == d &&
            std::abs(d) < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return static_cast<std::int64_t>(d);
        }
        return std::nullopt;
    }
    if (value.isString()) {
        auto text = value.asString();
        std::int64_t out = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        if (ec == std::errc() && ptr == text.data() + text.size()) {
            return out;
        }
    }
    return std::nullopt;
}

auto read_override(const std::string& id, const Json::Value& entry,
                   std::vector<std::string>& warnings) -> ControlOverride {
    ControlOverride out;
    if (entry.isMember("show")) {
        const auto& show = entry["show"];
        if (show.isBool()) {
            out.show = show.asBool();
        } else {
            warnings.push_back(fmt::format("controls.{}.show: expected a boolean", id));
        }
    }
    if (entry.isMember("display_order")) {
        if (auto order = read_int(entry["display_order"])) {
            out.display_order = *order;
        } else {
            warnings.push_back(fmt::format("controls.{}.display_order: expected an integer", id));
        }
    }
    if (entry.isMember("width")) {
        const auto& width_value = entry["width"];
        auto width = read_int(width_value);
        if (width && *width > 0) {
            out.width = *width;
        } else if (!width_value.isNull()) {
            warnings.push_back(fmt::format("controls.{}.width: expected a positive integer", id));
        }
    }
    return out;
}

auto apply(Control& control, const ControlOverride& user) -> void {
    if (user.show) {
        control.show = *user.show;
    }
    if (user.display_order) {
        control.display_order = *user.display_order;
    }
    if (user.width) {
        control.width = *user.width;
    }
}

auto force_one_visible(std::vector<EffectiveControl>& controls) -> bool {
    for (const auto& c : controls) {
        if (c.control.show) {
            return false;
        }
    }
    EffectiveControl* best = nullptr;
    for (auto& c : controls) {
        if (best == nullptr) {
            best = &c;
            continue;
        }
        // Lowest display order over origin controls and orphans; first wins ties.
        if (c.control.display_order < best->control.display_order) {
            best = &c;
        }
    }
    if (best == nullptr) {
        return false;
    }
    best->control.show = true;
    return true;
}

}  // namespace

auto sanitize_control_overrides(const Json::Value& raw) -> SanitizedOverrides {
    SanitizedOverrides out;
    if (raw.isNull()) {
        return out;
    }
    if (!raw.isObject()) {
        out.warnings.emplace_back("controls: expected an object, ignoring");
        return out;
    }
    for (const auto& id : raw.getMemberNames()) {
        const auto& entry = raw[id];
        if (!entry.isObject()) {
            out.warnings.push_back(fmt::format("controls.{}: expected an object, ignoring", id));
            continue;
        }
        out.overrides.emplace(id, read_override(id, entry, out.warnings));
    }
    return out;
}

auto merge_controls(std::span<const Control> origin, const ControlOverrides& overrides)
    -> MergedControls {
    MergedControls merged;
    merged.controls.reserve(origin.size() + overrides.size());

    for (const auto& control : origin) {
        EffectiveControl effective{.control = control, .orphan = false};
        if (auto it = overrides.find(control.id); it != overrides.end()) {
            apply(effective.control, it->second);
        }
        merged.controls.push_back(std::move(effective));
    }

    for (const auto& [id, user] : overrides) {
        bool known = false;
        for (const auto& control : origin) {
            if (control.id == id) {
                known = true;
                break;
            }
        }
        if (known) {
            continue;
        }
        EffectiveControl orphan;
        orphan.control.id = id;
        orphan.control.show = false;
        orphan.control.display_order = 0;
        orphan.orphan = true;
        apply(orphan.control, user);
        merged.controls.push_back(std::move(orphan));
        ++merged.meta.orphan_count;
    }

    merged.meta.origin_count = origin.size();
    merged.meta.source_count = overrides.size();
    merged.meta.effective_count = merged.controls.size();
    merged.meta.forced_visible = force_one_visible(merged.controls);
    return merged;
}

auto normalize_controls_source(const ControlOverrides& overrides,
                               std::span<const EffectiveControl> effective) -> ControlOverrides {
    ControlOverrides normalized;
    for (const auto& c : effective) {
        if (c.orphan) {
            continue;
        }
        normalized.emplace(c.control.id, ControlOverride{.show = c.control.show,
                                                         .display_order = c.control.display_order,
                                                         .width = c.control.width});
    }
    for (const auto& [id, user] : overrides) {
        if (normalized.contains(id)) {
            continue;
        }
        if (user.show || user.display_order || user.width) {
            normalized.emplace(id, user);
        }
    }
    return normalized;
}

auto to_json(const ControlOverrides& overrides) -> Json::Value {
    Json::Value out(Json::objectValue);
    for (const auto& [id, user] : overrides) {
        Json::Value entry(Json::objectValue);
        if (user.show) {
            entry["show"] = *user.show;
        }
        if (user.display_order) {
            entry["display_order"] = static_cast<Json::Int64>(*user.display_order);
        }
        if (user.width) {
            entry["width"] = static_cast<Json::Int64>(*user.width);
        }
        out[id] = std::move(entry);
    }
    return out;
}

auto to_json(const EffectiveControl& c) -> Json::Value {
    Json::Value out = c.control.attributes.isObject() ? c.control.attributes
                                                      : Json::Value(Json::objectValue);
    out["controlId"] = c.control.id;
    out["group"] = c.control.source.group;
    out["field"] = c.control.source.field;
    out["label"] = c.control.label;
    out["type"] = std::string(to_string(c.control.type));
    out["show"] = c.control.show;
    out["display_order"] = static_cast<Json::Int64>(c.control.display_order);
    out["width"] = c.control.width ? Json::Value(static_cast<Json::Int64>(*c.control.width))
                                   : Json::Value(Json::nullValue);
    if (c.orphan) {
        out["orphan"] = true;
    }
    return out;
}

}  // namespace tabula::state

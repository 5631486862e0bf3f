#include <tabula/state/controls.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string_view>

#include "test_support.hpp"

namespace {

using namespace tabula;

auto origin() -> std::vector<Control> {
    return {test::make_control("a", "DATA", "A", ControlType::String, 1),
            test::make_control("b", "DATA", "B", ControlType::Number, 2),
            test::make_control("c", "DATA", "C", ControlType::Date, 3)};
}

auto overrides_from(const char* text) -> Json::Value {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string_view view{text};
    REQUIRE(reader->parse(view.data(), view.data() + view.size(), &root, &errors));
    return root;
}

auto find(const state::MergedControls& merged, const std::string& id)
    -> const state::EffectiveControl* {
    for (const auto& c : merged.controls) {
        if (c.control.id == id) {
            return &c;
        }
    }
    return nullptr;
}

}  // namespace

TEST_CASE("Merge with no overrides keeps the origin") {
    auto controls = origin();
    auto merged = state::merge_controls(controls, {});

    REQUIRE(merged.controls.size() == 3);
    REQUIRE(merged.controls[0].control.id == "a");
    REQUIRE(merged.controls[2].control.id == "c");
    REQUIRE(merged.meta.origin_count == 3);
    REQUIRE(merged.meta.source_count == 0);
    REQUIRE(merged.meta.orphan_count == 0);
    REQUIRE_FALSE(merged.meta.forced_visible);
}

TEST_CASE("Overrides change only user keys") {
    auto controls = origin();
    state::ControlOverrides overrides;
    overrides["b"] = state::ControlOverride{.show = false, .display_order = 9, .width = 120};

    auto merged = state::merge_controls(controls, overrides);
    const auto* b = find(merged, "b");
    REQUIRE(b != nullptr);
    REQUIRE_FALSE(b->control.show);
    REQUIRE(b->control.display_order == 9);
    REQUIRE(b->control.width == 120);
    REQUIRE(b->control.source.field == "B");
    REQUIRE(b->control.type == ControlType::Number);
    REQUIRE(b->control.label == "b");
}

TEST_CASE("Overrides for unknown controls become hidden orphans") {
    auto controls = origin();
    state::ControlOverrides overrides;
    overrides["zz"] = state::ControlOverride{.width = 40};

    auto merged = state::merge_controls(controls, overrides);
    REQUIRE(merged.meta.orphan_count == 1);
    REQUIRE(merged.meta.effective_count == 4);
    REQUIRE(merged.controls.back().control.id == "zz");
    REQUIRE(merged.controls.back().orphan);
    REQUIRE_FALSE(merged.controls.back().control.show);
    REQUIRE(merged.controls.back().control.display_order == 0);
    REQUIRE(merged.controls.back().control.width == 40);
}

TEST_CASE("At least one control stays visible") {
    auto controls = origin();
    state::ControlOverrides overrides;
    overrides["a"] = state::ControlOverride{.show = false, .display_order = 5};
    overrides["b"] = state::ControlOverride{.show = false};
    overrides["c"] = state::ControlOverride{.show = false};
    overrides["ghost"] = state::ControlOverride{.show = false, .display_order = -10};

    auto merged = state::merge_controls(controls, overrides);
    REQUIRE(merged.meta.forced_visible);

    std::size_t visible = 0;
    for (const auto& c : merged.controls) {
        visible += c.control.show ? 1 : 0;
    }
    REQUIRE(visible == 1);
    // The orphan carries the lowest display order (-10).
    REQUIRE(find(merged, "ghost")->control.show);
    REQUIRE_FALSE(find(merged, "b")->control.show);
}

TEST_CASE("Forced visibility picks the lowest order among origin controls") {
    auto controls = origin();
    state::ControlOverrides overrides;
    overrides["a"] = state::ControlOverride{.show = false, .display_order = 5};
    overrides["b"] = state::ControlOverride{.show = false};
    overrides["c"] = state::ControlOverride{.show = false};

    auto merged = state::merge_controls(controls, overrides);
    REQUIRE(merged.meta.forced_visible);
    REQUIRE(find(merged, "b")->control.show);
    REQUIRE_FALSE(find(merged, "a")->control.show);
    REQUIRE_FALSE(find(merged, "c")->control.show);
}

TEST_CASE("Forced visibility ties keep the first control") {
    std::vector<Control> controls{test::make_control("x", "DATA", "X", ControlType::String, 1),
                                  test::make_control("y", "DATA", "Y", ControlType::String, 1)};
    state::ControlOverrides overrides;
    overrides["x"] = state::ControlOverride{.show = false};
    overrides["y"] = state::ControlOverride{.show = false};

    auto merged = state::merge_controls(controls, overrides);
    REQUIRE(merged.controls[0].control.show);
    REQUIRE_FALSE(merged.controls[1].control.show);
}

TEST_CASE("Sanitizing overrides drops malformed entries with warnings") {
    auto raw = overrides_from(R"({
        "a": {"show": "yes", "display_order": "4", "width": 80},
        "b": 17,
        "c": {"display_order": 2.5, "width": -3},
        "d": {"width": null}
    })");

    auto sanitized = state::sanitize_control_overrides(raw);
    REQUIRE(sanitized.overrides.size() == 3);
    REQUIRE_FALSE(sanitized.overrides.contains("b"));

    const auto& a = sanitized.overrides.at("a");
    REQUIRE_FALSE(a.show.has_value());
    REQUIRE(a.display_order == 4);
    REQUIRE(a.width == 80);

    const auto& c = sanitized.overrides.at("c");
    REQUIRE_FALSE(c.display_order.has_value());
    REQUIRE_FALSE(c.width.has_value());

    // a.show, b, c.display_order, c.width; a null width is just "unset".
    REQUIRE(sanitized.warnings.size() == 4);
}

TEST_CASE("Sanitizing a non-object yields no overrides") {
    REQUIRE(state::sanitize_control_overrides(Json::Value{}).warnings.empty());
    auto sanitized = state::sanitize_control_overrides(Json::Value("oops"));
    REQUIRE(sanitized.overrides.empty());
    REQUIRE(sanitized.warnings.size() == 1);
}

TEST_CASE("Normalized source pins every effective control and keeps keyed orphans") {
    auto controls = origin();
    state::ControlOverrides overrides;
    overrides["a"] = state::ControlOverride{.width = 50};
    overrides["old"] = state::ControlOverride{.show = true};
    overrides["empty"] = state::ControlOverride{};

    auto merged = state::merge_controls(controls, overrides);
    auto normalized = state::normalize_controls_source(overrides, merged.controls);

    REQUIRE(normalized.size() == 4);
    REQUIRE(normalized.at("a").width == 50);
    REQUIRE(normalized.at("a").show == true);
    REQUIRE(normalized.at("c").display_order == 3);
    REQUIRE(normalized.at("old").show == true);
    REQUIRE_FALSE(normalized.contains("empty"));

    // Normalizing again is a fixed point.
    auto again = state::normalize_controls_source(
        normalized, state::merge_controls(controls, normalized).controls);
    REQUIRE(again == normalized);
}

TEST_CASE("Override JSON round-trips through sanitize") {
    state::ControlOverrides overrides;
    overrides["a"] = state::ControlOverride{.show = false, .display_order = 7};
    overrides["b"] = state::ControlOverride{.width = 33};

    auto sanitized = state::sanitize_control_overrides(state::to_json(overrides));
    REQUIRE(sanitized.warnings.empty());
    REQUIRE(sanitized.overrides == overrides);
}

#include <tabula/state/table_state.hpp>
#include <tabula/store/json_codec.hpp>

#include <catch2/catch_test_macros.hpp>

namespace {

using namespace tabula;

auto json(const char* text) -> Json::Value {
    auto parsed = store::parse_json(text);
    REQUIRE(parsed.has_value());
    return *parsed;
}

}  // namespace

TEST_CASE("Missing table state gives defaults without warnings") {
    auto merged = state::merge_table_state(Json::Value{});
    REQUIRE(merged.state == state::TableState{});
    REQUIRE_FALSE(merged.meta.source_ok);
    REQUIRE(merged.meta.warnings.empty());
}

TEST_CASE("Non-object table state is reported") {
    auto merged = state::merge_table_state(json("[1, 2]"));
    REQUIRE(merged.state == state::TableState{});
    REQUIRE_FALSE(merged.meta.source_ok);
    REQUIRE(merged.meta.warnings.size() == 1);
}

TEST_CASE("Well-formed table state is read") {
    auto merged = state::merge_table_state(json(R"({
        "sort": {"controlId": "amount", "direction": "desc"},
        "filters": {"name": "  ap ", "kind": ""},
        "group": {"enabled": true, "by": "kind", "sumBy": "amount"}
    })"));

    REQUIRE(merged.meta.source_ok);
    REQUIRE(merged.meta.warnings.empty());
    REQUIRE(merged.state.sort.control_id == "amount");
    REQUIRE(merged.state.sort.direction == state::SortDirection::Descending);
    REQUIRE(merged.state.sort.active());
    REQUIRE(merged.state.filters.size() == 1);
    REQUIRE(merged.state.filters.at("name") == "ap");
    REQUIRE(merged.state.group.enabled);
    REQUIRE(merged.state.group.by == "kind");
    REQUIRE(merged.state.group.sum_by == "amount");
}

TEST_CASE("Legacy key spellings are accepted") {
    auto merged = state::merge_table_state(json(R"({
        "sort": {"control_guid": "name", "direction": "asc"},
        "group": {"enabled": false, "sum_control_guid": "amount"}
    })"));
    REQUIRE(merged.state.sort.control_id == "name");
    REQUIRE(merged.state.sort.direction == state::SortDirection::Ascending);
    REQUIRE(merged.state.group.sum_by == "amount");
}

TEST_CASE("Malformed parts fall back to their defaults") {
    auto merged = state::merge_table_state(json(R"({
        "sort": {"controlId": 12, "direction": "sideways"},
        "filters": {"a": 3, "b": true, "c": [1], "d": null, "e": 2.5},
        "group": {"enabled": "yes", "by": {"x": 1}}
    })"));

    REQUIRE(merged.meta.source_ok);
    REQUIRE_FALSE(merged.state.sort.control_id.has_value());
    REQUIRE(merged.state.sort.direction == state::SortDirection::None);
    REQUIRE_FALSE(merged.state.sort.active());

    REQUIRE(merged.state.filters.size() == 3);
    REQUIRE(merged.state.filters.at("a") == "3");
    REQUIRE(merged.state.filters.at("b") == "true");
    REQUIRE(merged.state.filters.at("e") == "2.5");

    REQUIRE_FALSE(merged.state.group.enabled);
    REQUIRE_FALSE(merged.state.group.by.has_value());

    // sort.controlId, sort.direction, filters.c, group.enabled, group.by
    REQUIRE(merged.meta.warnings.size() == 5);
}

TEST_CASE("Sort direction without a control is inactive") {
    auto merged = state::merge_table_state(json(R"({"sort": {"direction": "asc"}})"));
    REQUIRE(merged.state.sort.direction == state::SortDirection::Ascending);
    REQUIRE_FALSE(merged.state.sort.active());
}

TEST_CASE("Serialized table state reads back to the same state") {
    state::TableState original;
    original.sort =
        state::SortSpec{.control_id = "name", .direction = state::SortDirection::Ascending};
    original.filters["kind"] = "fruit";
    original.group = state::GroupSpec{.enabled = true, .by = "kind", .sum_by = std::nullopt};

    auto merged = state::merge_table_state(state::to_json(original));
    REQUIRE(merged.meta.warnings.empty());
    REQUIRE(merged.state == original);
}

TEST_CASE("Canonical JSON is stable and compact") {
    auto a = state::merge_table_state(json(R"({"filters": {"b": "2", "a": "1"}})")).state;
    auto b =
        state::merge_table_state(json(R"({"filters": {"a": "1", "b": "2"}, "sort": null})")).state;

    REQUIRE(state::canonical_json(a) == state::canonical_json(b));
    REQUIRE(state::canonical_json(state::TableState{}) ==
            R"({"filters":{},"group":{"by":null,"enabled":false,"sumBy":null},)"
            R"("sort":{"controlId":null,"direction":null}})");
}

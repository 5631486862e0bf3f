#include <tabula/runtime/matrix.hpp>
#include <tabula/store/json_codec.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>

#include "test_support.hpp"

namespace {

using namespace tabula;

auto json(const char* text) -> Json::Value {
    auto parsed = store::parse_json(text);
    REQUIRE(parsed.has_value());
    return *parsed;
}

constexpr const char* kFixture = R"({
    "views": {
        "fruit": {
            "ROOT": {"TABLE": "fruit", "VIEW_NAME": "Fruit", "DEFAULT_SORT_COLUMN": "name"},
            "MAIN": {
                "price": {"gruppe": "DATA", "feld": "PRICE", "type": "float", "display_order": 2},
                "name": {"group": "DATA", "field": "NAME", "label": "Name", "display_order": 1,
                         "width": 120}
            }
        }
    },
    "tables": {
        "fruit": [
            {"id": "f1", "name": "apple", "modified_at": "2025-01-02",
             "fields": {"DATA": {"NAME": "apple", "PRICE": {"2024-01-01": 1.5, "2025-01-01": 2}}}},
            {"uid": "f2", "name": "pear", "gilt_bis": "2025-02-01", "historisch": true,
             "daten": {"DATA": {"NAME": "pear"}}}
        ]
    },
    "lookups": {
        "sys_dropdowndaten": {"colours": {"DE-DE": {"c": {"name": "colour", "edit_list": []}}}}
    },
    "state": {
        "fruit": {"controls": {"price": {"show": false}}, "table_state": {"filters": {"name": "a"}}}
    }
})";

}  // namespace

TEST_CASE("parse_json reports syntax errors as invalid input") {
    auto parsed = store::parse_json("{\"a\": ");
    REQUIRE_FALSE(parsed.has_value());
    REQUIRE(parsed.error().kind == ErrorKind::InvalidInput);
}

TEST_CASE("Scalar values decode to their natural types") {
    REQUIRE(is_null(store::decode_value(Json::Value{})));
    REQUIRE(std::get<bool>(store::decode_value(Json::Value(true))));
    REQUIRE(std::get<std::int64_t>(store::decode_value(Json::Value(42))) == 42);
    REQUIRE(std::get<double>(store::decode_value(Json::Value(2.5))) == 2.5);
    REQUIRE(std::get<std::string>(store::decode_value(Json::Value("x"))) == "x");
    REQUIRE(std::get<std::string>(store::decode_value(json("[1,2]"))) == "[1,2]");
}

TEST_CASE("Objects keyed by timestamps decode as temporal fields") {
    auto temporal = store::decode_field(json(R"({"2025-01-01": "a", "2025043": "b"})"));
    REQUIRE(temporal.is_temporal());
    const auto& versions = std::get<TemporalMap>(temporal.data);
    REQUIRE(versions.size() == 2);
    REQUIRE(std::get<std::string>(versions.at(test::day(2025, 2, 12))) == "b");

    auto plain = store::decode_field(json(R"({"colour": "red"})"));
    REQUIRE_FALSE(plain.is_temporal());
    REQUIRE(std::get<std::string>(std::get<Value>(plain.data)) == R"({"colour":"red"})");

    REQUIRE_FALSE(store::decode_field(json("{}")).is_temporal());
}

TEST_CASE("Timestamps decode from text and legacy numbers") {
    REQUIRE(store::decode_timestamp(Json::Value("2025-01-01")) == test::day(2025, 1, 1));
    REQUIRE(store::decode_timestamp(Json::Value(2025001)) == test::day(2025, 1, 1));
    REQUIRE(store::decode_timestamp(Json::Value(1001.0)) == kSentinelMin);
    REQUIRE_FALSE(store::decode_timestamp(Json::Value(true)).has_value());
    REQUIRE_FALSE(
        store::decode_timestamp(Json::Value(std::numeric_limits<double>::infinity())).has_value());
    REQUIRE_FALSE(
        store::decode_timestamp(Json::Value(std::numeric_limits<Json::UInt64>::max())).has_value());
}

TEST_CASE("Records decode with aliases and defaults") {
    auto fixture = json(kFixture);
    const auto& rows = fixture["tables"]["fruit"];

    auto apple = store::decode_record(rows[0]);
    REQUIRE(apple.has_value());
    REQUIRE(apple->id == "f1");
    REQUIRE(apple->created_at == kSentinelMin);
    REQUIRE(apple->modified_at == test::day(2025, 1, 2));
    REQUIRE(apple->valid_until == kSentinelMax);
    REQUIRE_FALSE(apple->retired);
    const auto* price = apple->find(FieldKey{.group = "DATA", .field = "PRICE"});
    REQUIRE(price != nullptr);
    REQUIRE(price->is_temporal());

    auto pear = store::decode_record(rows[1]);
    REQUIRE(pear.has_value());
    REQUIRE(pear->id == "f2");
    REQUIRE(pear->valid_until == test::day(2025, 2, 1));
    REQUIRE(pear->retired);
    REQUIRE(pear->find(FieldKey{.group = "DATA", .field = "NAME"}) != nullptr);
}

TEST_CASE("Malformed records are rejected") {
    REQUIRE(store::decode_record(json(R"({"name": "no id"})")).error().kind ==
            ErrorKind::InvalidInput);
    REQUIRE_FALSE(store::decode_record(json(R"({"id": "x", "created_at": "soon"})")).has_value());
    REQUIRE_FALSE(store::decode_record(json(R"({"id": "x", "fields": [1]})")).has_value());
    REQUIRE_FALSE(store::decode_record(json("3")).has_value());

    auto huge = store::decode_record(json(R"({"id": "x", "modified_at": 18446744073709551615})"));
    REQUIRE_FALSE(huge.has_value());
    REQUIRE(huge.error().kind == ErrorKind::InvalidInput);
}

TEST_CASE("View definitions decode from the stored layout") {
    auto fixture = json(kFixture);
    auto view = store::decode_view("fruit", fixture["views"]["fruit"]);
    REQUIRE(view.has_value());
    REQUIRE(view->name == "Fruit");
    REQUIRE(view->root_table == "fruit");
    REQUIRE(view->default_sort == "name");
    REQUIRE(view->filterable);
    REQUIRE_FALSE(view->allow_table_override);

    REQUIRE(view->controls.size() == 2);
    REQUIRE(view->controls[0].id == "name");
    REQUIRE(view->controls[0].label == "Name");
    REQUIRE(view->controls[0].width == 120);
    REQUIRE(view->controls[1].id == "price");
    REQUIRE(view->controls[1].type == ControlType::Number);
    REQUIRE(view->controls[1].source == FieldKey{.group = "DATA", .field = "PRICE"});

    REQUIRE_FALSE(store::decode_view("bad", json(R"({"MAIN": {}})")).has_value());
}

TEST_CASE("Origin control keys pass through to clients") {
    auto view = store::decode_view("v", json(R"({
        "ROOT": {"TABLE": "t"},
        "MAIN": {"c1": {"gruppe": "G", "feld": "f", "label": "L", "type": "dropdown",
                        "searchable": false, "filterType": "exact", "sortDirection": "desc",
                        "configs": {"dropdown": {"key": "ds1", "feld": "anrede"}}}}
    })"));
    REQUIRE(view.has_value());
    const auto& control = view->controls.at(0);
    REQUIRE(control.attributes.size() == 4);
    REQUIRE_FALSE(control.attributes.isMember("gruppe"));
    REQUIRE_FALSE(control.attributes.isMember("type"));

    auto encoded = state::to_json(state::EffectiveControl{.control = control, .orphan = false});
    REQUIRE(encoded["controlId"].asString() == "c1");
    REQUIRE(encoded["type"].asString() == "dropdown");
    REQUIRE(encoded["searchable"].asBool() == false);
    REQUIRE(encoded["filterType"].asString() == "exact");
    REQUIRE(encoded["sortDirection"].asString() == "desc");
    REQUIRE(encoded["configs"]["dropdown"]["key"].asString() == "ds1");

    // Engine-owned keys win over attributes of the same name.
    auto shadowed = control;
    shadowed.attributes["show"] = "sometimes";
    shadowed.show = false;
    auto hidden = state::to_json(state::EffectiveControl{.control = shadowed, .orphan = false});
    REQUIRE(hidden["show"].isBool());
    REQUIRE_FALSE(hidden["show"].asBool());

    auto definition = store::encode_definition(*view);
    REQUIRE(definition["controls"][0]["filterType"].asString() == "exact");
}

TEST_CASE("Values encode for transport") {
    REQUIRE(store::encode_value(Value{}).isNull());
    REQUIRE(store::encode_value(Value{std::numeric_limits<double>::quiet_NaN()}).isNull());
    REQUIRE(store::encode_value(Value{test::day(2025, 3, 4)}).asString() == "2025-03-04");
    REQUIRE(store::encode_value(Value{std::int64_t{9}}).asInt64() == 9);
}

TEST_CASE("Fixture documents populate every store") {
    auto fixture = store::load_fixture(json(kFixture));
    REQUIRE(fixture.has_value());

    REQUIRE(fixture->views->load_view("fruit").has_value());
    REQUIRE(fixture->lookups->load_dataset("sys_dropdowndaten", "colours")->has_value());
    REQUIRE(fixture->records->size("fruit") == 2);
    auto stored = fixture->state->load_override("fruit");
    REQUIRE(stored.has_value());
    REQUIRE(stored->has_value());
    REQUIRE((*stored)->controls["price"]["show"].asBool() == false);

    auto broken = store::load_fixture(json(R"({"tables": {"t": {"not": "an array"}}})"));
    REQUIRE_FALSE(broken.has_value());
    REQUIRE_FALSE(store::load_fixture(json(R"({"lookups": {"t": []}})")).has_value());
}

TEST_CASE("Fixture files") {
    REQUIRE(store::load_fixture_file("/nonexistent/fixture.json").error().kind ==
            ErrorKind::NotFound);

    auto path = std::filesystem::temp_directory_path() / "tabula_test_fixture.json";
    {
        std::ofstream out(path);
        out << kFixture;
    }
    auto fixture = store::load_fixture_file(path);
    std::filesystem::remove(path);
    REQUIRE(fixture.has_value());
    REQUIRE(fixture->records->size("fruit") == 2);
}

TEST_CASE("Matrix responses encode with camelCase metadata") {
    auto fixture = store::load_fixture(json(kFixture));
    REQUIRE(fixture.has_value());
    runtime::SessionCacheStore session(*fixture->records, runtime::TableCacheOptions{}, 10);
    runtime::MatrixOptions options;
    options.today = [] { return make_date(2025, 1, 10); };

    runtime::MatrixRequest request;
    request.view_id = "fruit";
    request.table_state_source = json(R"({"group": {"enabled": true, "by": "name"}})");
    auto response = runtime::build_matrix(*fixture->views, session, options, request);
    REQUIRE(response.has_value());

    auto encoded = store::encode_matrix(*response);
    REQUIRE(encoded["viewId"].asString() == "fruit");
    REQUIRE(encoded["asOf"].asString() == "2025-01-10");
    REQUIRE(encoded["meta"]["totalAfterFilter"].asUInt64() == 2);
    REQUIRE(encoded["meta"]["totalsScope"].asString() == "global");
    REQUIRE(encoded["meta"]["tableState"]["sourceOk"].asBool());
    REQUIRE(encoded["totals"]["count"].asUInt64() == 2);
    REQUIRE(encoded["totals"]["sum"].isNull());

    const auto& rows = encoded["rows"];
    REQUIRE(rows.size() == 4);
    REQUIRE(rows[0]["kind"].asString() == "group");
    REQUIRE(rows[0]["key"].asString() == "apple");
    REQUIRE(rows[1]["kind"].asString() == "data");
    REQUIRE(rows[1]["groupKey"].asString() == "apple");
    REQUIRE(rows[1]["cells"]["price"].asDouble() == 2.0);
    REQUIRE(rows[1]["effectiveFrom"]["price"].asString() == "2025-01-01");

    auto definition = store::encode_definition(fixture->views->load_view("fruit").value());
    REQUIRE(definition["rootTable"].asString() == "fruit");
    REQUIRE(definition["controls"].size() == 2);
    REQUIRE(definition["controls"][0]["controlId"].asString() == "name");
}

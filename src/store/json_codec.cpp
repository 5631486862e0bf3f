#include <tabula/store/json_codec.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>

namespace tabula::store {

namespace {

auto string_member(const Json::Value& obj, std::initializer_list<const char*> names)
    -> std::optional<std::string> {
    for (const char* name : names) {
        if (obj.isMember(name) && obj[name].isString()) {
            return obj[name].asString();
        }
    }
    return std::nullopt;
}

auto find_member(const Json::Value& obj, std::initializer_list<const char*> names)
    -> const Json::Value* {
    for (const char* name : names) {
        if (obj.isMember(name) && !obj[name].isNull()) {
            return &obj[name];
        }
    }
    return nullptr;
}

auto read_int(const Json::Value& json) -> std::optional<std::int64_t> {
    if (json.type() == Json::intValue || (json.type() == Json::uintValue && json.isInt64())) {
        return json.asInt64();
    }
    if (json.isDouble() && json.isInt64()) {
        return json.asInt64();
    }
    return std::nullopt;
}

auto read_bool(const Json::Value& obj, const char* name, bool fallback) -> bool {
    if (obj.isMember(name) && obj[name].isBool()) {
        return obj[name].asBool();
    }
    return fallback;
}

auto timestamp_member(const Json::Value& obj, std::initializer_list<const char*> names,
                      Timestamp fallback, std::string_view what) -> Result<Timestamp> {
    const auto* json = find_member(obj, names);
    if (json == nullptr) {
        return fallback;
    }
    if (json->isString() && json->asString().empty()) {
        return fallback;
    }
    if (auto ts = decode_timestamp(*json)) {
        return *ts;
    }
    return invalid_input(fmt::format("{}: not a timestamp: {}", what, write_compact(*json)));
}

auto is_modeled_control_key(std::string_view key) -> bool {
    static constexpr std::array<std::string_view, 10> kModeled = {
        "gruppe", "group", "feld",         "field", "label",
        "type",   "show",  "display_order", "width", "control_type"};
    return std::find(kModeled.begin(), kModeled.end(), key) != kModeled.end();
}

auto decode_control(const std::string& id, const Json::Value& json) -> Control {
    Control control;
    control.id = id;
    control.source.group = string_member(json, {"gruppe", "group"}).value_or("");
    control.source.field = string_member(json, {"feld", "field"}).value_or("");
    control.label = string_member(json, {"label"}).value_or("");
    control.type = parse_control_type(string_member(json, {"type", "control_type"}).value_or(""));
    control.show = read_bool(json, "show", true);
    if (const auto* order = find_member(json, {"display_order"})) {
        control.display_order = read_int(*order).value_or(0);
    }
    if (const auto* width = find_member(json, {"width"})) {
        if (auto w = read_int(*width); w && *w > 0) {
            control.width = *w;
        }
    }
    for (const auto& key : json.getMemberNames()) {
        if (!is_modeled_control_key(key)) {
            control.attributes[key] = json[key];
        }
    }
    return control;
}

auto encode_aggregate(const std::optional<runtime::Aggregate>& aggregate) -> Json::Value {
    if (!aggregate) {
        return Json::Value(Json::nullValue);
    }
    Json::Value out(Json::objectValue);
    out["count"] = static_cast<Json::UInt64>(aggregate->count);
    out["sum"] = aggregate->sum ? Json::Value(*aggregate->sum) : Json::Value(Json::nullValue);
    return out;
}

auto encode_dropdowns(const runtime::Dropdowns& dropdowns) -> Json::Value {
    Json::Value out(Json::objectValue);
    for (const auto& [control_id, dropdown] : dropdowns) {
        Json::Value entry(Json::objectValue);
        entry["table"] = dropdown.source.table;
        entry["key"] = dropdown.source.key;
        entry["feld"] = dropdown.source.field;
        Json::Value labels(Json::objectValue);
        for (const auto& [key, label] : dropdown.list.labels) {
            labels[key] = label;
        }
        entry["map"] = std::move(labels);
        Json::Value options(Json::arrayValue);
        for (const auto& option : dropdown.list.options) {
            Json::Value item(Json::objectValue);
            item["key"] = option.key;
            item["value"] = option.value;
            options.append(std::move(item));
        }
        entry["options"] = std::move(options);
        entry["language"] = dropdown.language;
        entry["default_language"] = dropdown.default_language;
        out[control_id] = std::move(entry);
    }
    return out;
}

auto encode_row(const runtime::MatrixRow& row) -> Json::Value {
    Json::Value out(Json::objectValue);
    if (row.kind == runtime::MatrixRowKind::Group) {
        out["kind"] = "group";
        out["key"] = row.key;
        out["raw"] = encode_value(row.raw);
        out["count"] = static_cast<Json::UInt64>(row.count);
        out["sum"] = row.sum ? Json::Value(*row.sum) : Json::Value(Json::nullValue);
        return out;
    }
    out["kind"] = "data";
    out["id"] = row.id;
    out["name"] = row.name;
    if (row.group_key) {
        out["groupKey"] = *row.group_key;
    }
    Json::Value cells(Json::objectValue);
    Json::Value effective(Json::objectValue);
    for (const auto& cell : row.cells) {
        cells[cell.control_id] = encode_value(cell.value);
        if (cell.effective_from) {
            effective[cell.control_id] = format_timestamp(*cell.effective_from);
        }
    }
    out["cells"] = std::move(cells);
    out["effectiveFrom"] = std::move(effective);
    return out;
}

auto encode_meta(const runtime::MatrixMeta& meta) -> Json::Value {
    Json::Value out(Json::objectValue);
    out["maxBaseRows"] = static_cast<Json::UInt64>(meta.max_base_rows);
    out["baseLoaded"] = static_cast<Json::UInt64>(meta.base_loaded);
    out["totalAfterFilter"] = static_cast<Json::UInt64>(meta.total_after_filter);
    out["offset"] = static_cast<Json::UInt64>(meta.offset);
    out["limit"] = static_cast<Json::UInt64>(meta.limit);
    out["returnedData"] = static_cast<Json::UInt64>(meta.returned_data);
    out["returnedRows"] = static_cast<Json::UInt64>(meta.returned_rows);
    out["hasMore"] = meta.has_more;
    out["cacheHit"] = meta.cache_hit;
    out["tableVersion"] = static_cast<Json::UInt64>(meta.table_version);
    out["truncated"] = meta.truncated;
    out["totalsScope"] = meta.totals_scope;

    Json::Value controls(Json::objectValue);
    controls["originCount"] = static_cast<Json::UInt64>(meta.controls.origin_count);
    controls["sourceCount"] = static_cast<Json::UInt64>(meta.controls.source_count);
    controls["effectiveCount"] = static_cast<Json::UInt64>(meta.controls.effective_count);
    controls["orphanCount"] = static_cast<Json::UInt64>(meta.controls.orphan_count);
    controls["forcedVisible"] = meta.controls.forced_visible;
    out["controls"] = std::move(controls);

    Json::Value table_state(Json::objectValue);
    table_state["sourceOk"] = meta.table_state.source_ok;
    out["tableState"] = std::move(table_state);

    Json::Value warnings(Json::arrayValue);
    for (const auto& warning : meta.warnings) {
        warnings.append(warning);
    }
    out["warnings"] = std::move(warnings);
    return out;
}

}  // namespace

// ─── Parsing ──────────────────────────────────────────────────────────────────

auto parse_json(std::string_view text) -> Result<Json::Value> {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        return invalid_input(fmt::format("invalid JSON: {}", errs));
    }
    return root;
}

auto read_json_file(const std::filesystem::path& path) -> Result<Json::Value> {
    std::ifstream in(path);
    if (!in) {
        return not_found(fmt::format("cannot open '{}'", path.string()));
    }
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        return invalid_input(fmt::format("invalid JSON in '{}': {}", path.string(), errs));
    }
    return root;
}

auto write_compact(const Json::Value& value) -> std::string {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

auto write_pretty(const Json::Value& value) -> std::string {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

// ─── Decoding ─────────────────────────────────────────────────────────────────

auto decode_value(const Json::Value& json) -> Value {
    switch (json.type()) {
        case Json::nullValue:
            return std::monostate{};
        case Json::booleanValue:
            return json.asBool();
        case Json::intValue:
            return static_cast<std::int64_t>(json.asInt64());
        case Json::uintValue:
            if (json.isInt64()) {
                return static_cast<std::int64_t>(json.asInt64());
            }
            return json.asDouble();
        case Json::realValue:
            return json.asDouble();
        case Json::stringValue:
            return json.asString();
        case Json::arrayValue:
        case Json::objectValue:
            return write_compact(json);
    }
    return std::monostate{};
}

auto decode_field(const Json::Value& json) -> FieldValue {
    if (!json.isObject() || json.empty()) {
        return FieldValue::scalar(decode_value(json));
    }
    TemporalMap versions;
    for (const auto& key : json.getMemberNames()) {
        auto ts = parse_timestamp(key);
        if (!ts) {
            return FieldValue::scalar(decode_value(json));
        }
        versions.insert_or_assign(*ts, decode_value(json[key]));
    }
    return FieldValue::temporal(std::move(versions));
}

auto decode_timestamp(const Json::Value& json) -> std::optional<Timestamp> {
    if (json.isString()) {
        return parse_timestamp(json.asString());
    }
    if (json.type() == Json::intValue || json.type() == Json::uintValue) {
        if (!json.isInt64()) {
            return std::nullopt;
        }
        return parse_timestamp(fmt::format("{}", json.asInt64()));
    }
    if (json.type() == Json::realValue) {
        auto d = json.asDouble();
        if (!std::isfinite(d)) {
            return std::nullopt;
        }
        return parse_timestamp(fmt::format("{}", d));
    }
    return std::nullopt;
}

auto decode_record(const Json::Value& json) -> Result<Record> {
    if (!json.isObject()) {
        return invalid_input("record: expected an object");
    }
    Record record;
    auto id = string_member(json, {"id", "uid"});
    if (!id || id->empty()) {
        return invalid_input("record: missing id");
    }
    record.id = std::move(*id);
    record.name = string_member(json, {"name"}).value_or("");

    auto what = fmt::format("record '{}'", record.id);
    auto created = timestamp_member(json, {"created_at"}, kSentinelMin, what);
    if (!created) {
        return std::unexpected(created.error());
    }
    record.created_at = *created;
    auto modified = timestamp_member(json, {"modified_at"}, record.created_at, what);
    if (!modified) {
        return std::unexpected(modified.error());
    }
    record.modified_at = *modified;
    auto valid_until = timestamp_member(json, {"valid_until", "gilt_bis"}, kSentinelMax, what);
    if (!valid_until) {
        return std::unexpected(valid_until.error());
    }
    record.valid_until = *valid_until;
    record.retired = read_bool(json, "retired", read_bool(json, "historisch", false));

    if (const auto* fields = find_member(json, {"fields", "daten"})) {
        if (!fields->isObject()) {
            return invalid_input(fmt::format("{}: fields must be an object", what));
        }
        for (const auto& group : fields->getMemberNames()) {
            const auto& group_json = (*fields)[group];
            if (!group_json.isObject()) {
                return invalid_input(
                    fmt::format("{}: group '{}' must be an object", what, group));
            }
            for (const auto& field : group_json.getMemberNames()) {
                record.set(group, field, decode_field(group_json[field]));
            }
        }
    }
    return record;
}

auto decode_view(std::string view_id, const Json::Value& json) -> Result<ViewDefinition> {
    if (!json.isObject()) {
        return invalid_input(fmt::format("view '{}': expected an object", view_id));
    }
    const auto& root = json["ROOT"];
    if (!root.isObject()) {
        return invalid_input(fmt::format("view '{}': missing ROOT section", view_id));
    }

    ViewDefinition view;
    view.id = std::move(view_id);
    view.name = string_member(root, {"VIEW_NAME"}).value_or("");
    view.root_table = string_member(root, {"TABLE"}).value_or("");
    view.filterable = read_bool(root, "ALLOW_FILTER", true);
    view.sortable = read_bool(root, "ALLOW_SORT", true);
    view.allow_table_override = read_bool(root, "ALLOW_TABLE_OVERRIDE", false);
    if (auto sort = string_member(root, {"DEFAULT_SORT_COLUMN"}); sort && !sort->empty()) {
        view.default_sort = std::move(*sort);
    }

    for (const auto& section : json.getMemberNames()) {
        if (section == "ROOT" || !json[section].isObject()) {
            continue;
        }
        const auto& controls = json[section];
        for (const auto& id : controls.getMemberNames()) {
            if (controls[id].isObject()) {
                view.controls.push_back(decode_control(id, controls[id]));
            }
        }
    }
    std::stable_sort(view.controls.begin(), view.controls.end(),
                     [](const Control& lhs, const Control& rhs) {
                         if (lhs.display_order != rhs.display_order) {
                             return lhs.display_order < rhs.display_order;
                         }
                         return lhs.id < rhs.id;
                     });
    return view;
}

// ─── Encoding ─────────────────────────────────────────────────────────────────

auto encode_value(const Value& value) -> Json::Value {
    return std::visit(
        [](const auto& v) -> Json::Value {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return Json::Value(Json::nullValue);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return Json::Value(static_cast<Json::Int64>(v));
            } else if constexpr (std::is_same_v<T, double>) {
                if (!std::isfinite(v)) {
                    return Json::Value(Json::nullValue);
                }
                return Json::Value(v);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return Json::Value(format_timestamp(v));
            } else {
                return Json::Value(v);
            }
        },
        value);
}

auto encode_definition(const ViewDefinition& view) -> Json::Value {
    Json::Value out(Json::objectValue);
    out["viewId"] = view.id;
    out["name"] = view.name;
    out["rootTable"] = view.root_table;
    out["defaultSort"] =
        view.default_sort ? Json::Value(*view.default_sort) : Json::Value(Json::nullValue);
    out["filterable"] = view.filterable;
    out["sortable"] = view.sortable;
    out["allowTableOverride"] = view.allow_table_override;
    Json::Value controls(Json::arrayValue);
    for (const auto& control : view.controls) {
        controls.append(
            state::to_json(state::EffectiveControl{.control = control, .orphan = false}));
    }
    out["controls"] = std::move(controls);
    return out;
}

auto encode_matrix(const runtime::MatrixResponse& response) -> Json::Value {
    Json::Value out(Json::objectValue);
    out["viewId"] = response.view_id;
    out["table"] = response.table;
    out["asOf"] = format_date(response.as_of);
    out["controlsSource"] = state::to_json(response.controls_source);

    Json::Value controls(Json::arrayValue);
    for (const auto& control : response.controls) {
        controls.append(state::to_json(control));
    }
    out["controlsEffective"] = std::move(controls);

    auto table_state = state::to_json(response.table_state);
    out["tableStateSource"] = table_state;
    out["tableStateEffective"] = std::move(table_state);

    Json::Value rows(Json::arrayValue);
    for (const auto& row : response.rows) {
        rows.append(encode_row(row));
    }
    out["rows"] = std::move(rows);
    out["totals"] = encode_aggregate(response.totals);
    out["dropdowns"] = encode_dropdowns(response.dropdowns);
    out["meta"] = encode_meta(response.meta);
    return out;
}

// ─── Fixtures ─────────────────────────────────────────────────────────────────

auto load_fixture(const Json::Value& json) -> Result<Fixture> {
    if (!json.isObject()) {
        return invalid_input("fixture: expected an object");
    }
    Fixture fixture;

    const auto& views = json["views"];
    if (!views.isNull() && !views.isObject()) {
        return invalid_input("fixture: 'views' must be an object");
    }
    for (const auto& id : views.getMemberNames()) {
        auto view = decode_view(id, views[id]);
        if (!view) {
            return std::unexpected(view.error());
        }
        fixture.views->add(std::move(*view));
    }

    const auto& tables = json["tables"];
    if (!tables.isNull() && !tables.isObject()) {
        return invalid_input("fixture: 'tables' must be an object");
    }
    for (const auto& table : tables.getMemberNames()) {
        const auto& rows = tables[table];
        if (!rows.isArray()) {
            return invalid_input(fmt::format("fixture: table '{}' must be an array", table));
        }
        fixture.records->create_table(table);
        for (const auto& row : rows) {
            auto record = decode_record(row);
            if (!record) {
                return invalid_input(
                    fmt::format("fixture: table '{}': {}", table, record.error().message));
            }
            fixture.records->upsert(table, std::move(*record));
        }
    }

    const auto& lookups = json["lookups"];
    if (!lookups.isNull() && !lookups.isObject()) {
        return invalid_input("fixture: 'lookups' must be an object");
    }
    for (const auto& table : lookups.getMemberNames()) {
        const auto& datasets = lookups[table];
        if (!datasets.isObject()) {
            return invalid_input(fmt::format("fixture: lookups '{}' must be an object", table));
        }
        for (const auto& key : datasets.getMemberNames()) {
            fixture.lookups->add(table, key, datasets[key]);
        }
    }

    const auto& overrides = json["state"];
    if (!overrides.isNull() && !overrides.isObject()) {
        return invalid_input("fixture: 'state' must be an object");
    }
    for (const auto& key : overrides.getMemberNames()) {
        const auto& entry = overrides[key];
        if (!entry.isObject()) {
            return invalid_input(fmt::format("fixture: state '{}' must be an object", key));
        }
        auto saved = fixture.state->save_override(key, entry["controls"], entry["table_state"]);
        if (!saved) {
            return std::unexpected(saved.error());
        }
    }
    return fixture;
}

auto load_fixture_file(const std::filesystem::path& path) -> Result<Fixture> {
    auto json = read_json_file(path);
    if (!json) {
        return std::unexpected(json.error());
    }
    return load_fixture(*json);
}

}  // namespace tabula::store

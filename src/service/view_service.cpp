#include <tabula/service/view_service.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace tabula::service {

namespace {

auto optional_object(const Json::Value& body, const char* name)
    -> Result<std::optional<Json::Value>> {
    if (!body.isMember(name) || body[name].isNull()) {
        return std::optional<Json::Value>{};
    }
    if (!body[name].isObject()) {
        return invalid_input(fmt::format("{} must be an object", name));
    }
    return std::optional<Json::Value>{body[name]};
}

auto optional_int(const Json::Value& body, const char* name)
    -> Result<std::optional<std::int64_t>> {
    if (!body.isMember(name) || body[name].isNull()) {
        return std::optional<std::int64_t>{};
    }
    const auto& value = body[name];
    if (!value.isIntegral() || !value.isInt64()) {
        return invalid_input(fmt::format("{} must be an integer", name));
    }
    return std::optional<std::int64_t>{value.asInt64()};
}

}  // namespace

auto state_key(const ViewScope& scope) -> std::string {
    auto key = scope.view_id;
    if (scope.table && !scope.table->empty()) {
        key += ":";
        key += *scope.table;
    }
    if (scope.edit_type && !scope.edit_type->empty()) {
        key += ":";
        key += *scope.edit_type;
    }
    return key;
}

auto decode_state_update(const Json::Value& body) -> Result<StateUpdate> {
    if (!body.isObject()) {
        return invalid_input("state update must be an object");
    }
    StateUpdate update;
    auto controls = optional_object(body, "controlsSource");
    if (!controls) {
        return std::unexpected(controls.error());
    }
    auto table_state = optional_object(body, "tableStateSource");
    if (!table_state) {
        return std::unexpected(table_state.error());
    }
    if (*controls) {
        update.controls_source = std::move(**controls);
    }
    if (*table_state) {
        update.table_state_source = std::move(**table_state);
    }
    return update;
}

auto decode_matrix_query(const Json::Value& body) -> Result<MatrixQuery> {
    if (body.isNull()) {
        return MatrixQuery{};
    }
    if (!body.isObject()) {
        return invalid_input("matrix request must be an object");
    }
    MatrixQuery query;

    auto controls = optional_object(body, "controlsSource");
    if (!controls) {
        return std::unexpected(controls.error());
    }
    query.controls_source = std::move(*controls);
    auto table_state = optional_object(body, "tableStateSource");
    if (!table_state) {
        return std::unexpected(table_state.error());
    }
    query.table_state_source = std::move(*table_state);

    if (body.isMember("includeRetired") && !body["includeRetired"].isNull()) {
        if (!body["includeRetired"].isBool()) {
            return invalid_input("includeRetired must be a boolean");
        }
        query.include_retired = body["includeRetired"].asBool();
    }

    auto limit = optional_int(body, "limit");
    if (!limit) {
        return std::unexpected(limit.error());
    }
    query.limit = *limit;
    auto offset = optional_int(body, "offset");
    if (!offset) {
        return std::unexpected(offset.error());
    }
    query.offset = offset->value_or(0);
    auto max_base_rows = optional_int(body, "maxBaseRows");
    if (!max_base_rows) {
        return std::unexpected(max_base_rows.error());
    }
    query.max_base_rows = *max_base_rows;

    if (body.isMember("asOf") && !body["asOf"].isNull()) {
        const auto& as_of = body["asOf"];
        auto date = as_of.isString() ? parse_date(as_of.asString()) : std::nullopt;
        if (!date) {
            return invalid_input("asOf must be a date (YYYY-MM-DD)");
        }
        query.as_of = *date;
    }

    if (body.isMember("language") && !body["language"].isNull()) {
        if (!body["language"].isString()) {
            return invalid_input("language must be a string");
        }
        query.language = body["language"].asString();
    }
    return query;
}

auto to_json(const ViewStateResponse& response) -> Json::Value {
    Json::Value out(Json::objectValue);
    out["viewId"] = response.view_id;
    out["controlsSource"] = state::to_json(response.controls_source);
    Json::Value controls(Json::arrayValue);
    for (const auto& control : response.controls_effective) {
        controls.append(state::to_json(control));
    }
    out["controlsEffective"] = std::move(controls);
    auto table_state = state::to_json(response.table_state);
    out["tableStateSource"] = table_state;
    out["tableStateEffective"] = std::move(table_state);

    Json::Value meta(Json::objectValue);
    meta["originCount"] = static_cast<Json::UInt64>(response.controls_meta.origin_count);
    meta["sourceCount"] = static_cast<Json::UInt64>(response.controls_meta.source_count);
    meta["effectiveCount"] = static_cast<Json::UInt64>(response.controls_meta.effective_count);
    meta["orphanCount"] = static_cast<Json::UInt64>(response.controls_meta.orphan_count);
    meta["forcedVisible"] = response.controls_meta.forced_visible;
    Json::Value table_state_meta(Json::objectValue);
    table_state_meta["sourceOk"] = response.table_state_meta.source_ok;
    meta["tableState"] = std::move(table_state_meta);
    Json::Value warnings(Json::arrayValue);
    for (const auto& warning : response.warnings) {
        warnings.append(warning);
    }
    meta["warnings"] = std::move(warnings);
    out["meta"] = std::move(meta);
    return out;
}

ViewService::ViewService(store::ViewStore& views, store::StateStore& states,
                         runtime::SessionCacheStore& session, runtime::MatrixOptions options)
    : views_(views), states_(states), session_(session), options_(std::move(options)) {}

auto ViewService::get_definition(const std::string& view_id) -> Result<ViewDefinition> {
    return views_.load_view(view_id);
}

auto ViewService::load_stored(const std::string& key) -> Result<store::StoredOverride> {
    auto stored = states_.load_override(key);
    if (!stored) {
        return std::unexpected(stored.error());
    }
    return stored->value_or(store::StoredOverride{});
}

auto ViewService::resolve_state(const ViewDefinition& view, const Json::Value& controls,
                                const Json::Value& table_state) const -> ViewStateResponse {
    ViewStateResponse response;
    response.view_id = view.id;

    auto sanitized = state::sanitize_control_overrides(controls);
    auto merged = state::merge_controls(view.controls, sanitized.overrides);
    response.controls_source =
        state::normalize_controls_source(sanitized.overrides, merged.controls);
    response.controls_effective = std::move(merged.controls);
    response.controls_meta = merged.meta;

    auto merged_state = state::merge_table_state(table_state);
    response.table_state = std::move(merged_state.state);
    response.table_state_meta = merged_state.meta;

    response.warnings = std::move(sanitized.warnings);
    response.warnings.insert(response.warnings.end(), merged_state.meta.warnings.begin(),
                             merged_state.meta.warnings.end());
    for (const auto& warning : response.warnings) {
        spdlog::warn("view '{}': {}", view.id, warning);
    }
    return response;
}

auto ViewService::get_state(const ViewScope& scope) -> Result<ViewStateResponse> {
    auto view = views_.load_view(scope.view_id);
    if (!view) {
        return std::unexpected(view.error());
    }
    if (auto table = runtime::resolve_table(*view, scope.table); !table) {
        return std::unexpected(table.error());
    }
    auto stored = load_stored(state_key(scope));
    if (!stored) {
        return std::unexpected(stored.error());
    }
    return resolve_state(*view, stored->controls, stored->table_state);
}

auto ViewService::put_state(const ViewScope& scope, const StateUpdate& update)
    -> Result<ViewStateResponse> {
    auto view = views_.load_view(scope.view_id);
    if (!view) {
        return std::unexpected(view.error());
    }
    if (auto table = runtime::resolve_table(*view, scope.table); !table) {
        return std::unexpected(table.error());
    }
    const auto key = state_key(scope);
    auto stored = load_stored(key);
    if (!stored) {
        return std::unexpected(stored.error());
    }

    const auto& controls =
        update.controls_source.isNull() ? stored->controls : update.controls_source;
    const auto& table_state =
        update.table_state_source.isNull() ? stored->table_state : update.table_state_source;
    auto response = resolve_state(*view, controls, table_state);

    auto saved = states_.save_override(key, state::to_json(response.controls_source),
                                       state::to_json(response.table_state));
    if (!saved) {
        return std::unexpected(saved.error());
    }
    spdlog::debug("view state '{}' saved", key);
    return response;
}

auto ViewService::post_matrix(const ViewScope& scope, const MatrixQuery& query)
    -> Result<runtime::MatrixResponse> {
    runtime::MatrixRequest request;
    request.view_id = scope.view_id;
    request.table = scope.table;
    request.include_retired = query.include_retired;
    request.limit = query.limit.value_or(static_cast<std::int64_t>(options_.default_page_limit));
    request.offset = query.offset;
    request.as_of = query.as_of;
    request.max_base_rows = query.max_base_rows;
    request.language = query.language;

    if (!query.controls_source || !query.table_state_source) {
        auto stored = load_stored(state_key(scope));
        if (!stored) {
            return std::unexpected(stored.error());
        }
        request.controls_source = query.controls_source.value_or(stored->controls);
        request.table_state_source = query.table_state_source.value_or(stored->table_state);
    } else {
        request.controls_source = *query.controls_source;
        request.table_state_source = *query.table_state_source;
    }
    return runtime::build_matrix(views_, session_, options_, request);
}

}  // namespace tabula::service

#include <tabula/state/table_state.hpp>

#include <fmt/format.h>

namespace tabula::state {

namespace {

auto trim(std::string_view input) -> std::string_view {
    auto start = input.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = input.find_last_not_of(" \t\n\r");
    return input.substr(start, end - start + 1);
}

// First present member among `names`, or a null value.
auto member(const Json::Value& obj, std::initializer_list<const char*> names) -> const Json::Value* {
    for (const char* name : names) {
        if (obj.isMember(name)) {
            return &obj[name];
        }
    }
    return nullptr;
}

// Optional control id: null/absent -> nullopt; non-empty string -> id; else warning.
auto read_control_id(const Json::Value* value, std::string_view path,
                     std::vector<std::string>& warnings) -> std::optional<std::string> {
    if (value == nullptr || value->isNull()) {
        return std::nullopt;
    }
    if (value->isString()) {
        auto id = trim(value->asString());
        if (!id.empty()) {
            return std::string(id);
        }
        return std::nullopt;
    }
    warnings.push_back(fmt::format("{}: expected a control id or null", path));
    return std::nullopt;
}

auto read_sort(const Json::Value& raw, SortSpec& sort, std::vector<std::string>& warnings) {
    if (!raw.isObject()) {
        warnings.emplace_back("sort: expected an object, using default");
        return;
    }
    sort.control_id = read_control_id(member(raw, {"controlId", "control_guid"}), "sort.controlId",
                                      warnings);

    const auto* direction = member(raw, {"direction"});
    if (direction == nullptr || direction->isNull()) {
        return;
    }
    if (direction->isString()) {
        auto text = direction->asString();
        if (text == "asc") {
            sort.direction = SortDirection::Ascending;
            return;
        }
        if (text == "desc") {
            sort.direction = SortDirection::Descending;
            return;
        }
    }
    warnings.emplace_back("sort.direction: expected \"asc\", \"desc\" or null, using none");
}

auto read_filters(const Json::Value& raw, std::map<std::string, std::string>& filters,
                  std::vector<std::string>& warnings) {
    if (!raw.isObject()) {
        warnings.emplace_back("filters: expected an object, using none");
        return;
    }
    for (const auto& id : raw.getMemberNames()) {
        const auto& value = raw[id];
        if (value.isNull()) {
            continue;
        }
        std::string needle;
        if (value.isString()) {
            needle = std::string(trim(value.asString()));
        } else if (value.isBool()) {
            needle = value.asBool() ? "true" : "false";
        } else if (value.isIntegral()) {
            needle = fmt::format("{}", value.asInt64());
        } else if (value.isDouble()) {
            needle = fmt::format("{}", value.asDouble());
        } else {
            warnings.push_back(fmt::format("filters.{}: expected a string, ignoring", id));
            continue;
        }
        if (!needle.empty()) {
            filters.emplace(id, std::move(needle));
        }
    }
}

auto read_group(const Json::Value& raw, GroupSpec& group, std::vector<std::string>& warnings) {
    if (!raw.isObject()) {
        warnings.emplace_back("group: expected an object, using default");
        return;
    }
    if (const auto* enabled = member(raw, {"enabled"}); enabled != nullptr) {
        if (enabled->isBool()) {
            group.enabled = enabled->asBool();
        } else {
            warnings.emplace_back("group.enabled: expected a boolean, using false");
        }
    }
    group.by = read_control_id(member(raw, {"by"}), "group.by", warnings);
    group.sum_by =
        read_control_id(member(raw, {"sumBy", "sum_control_guid"}), "group.sumBy", warnings);
}

auto optional_string(const std::optional<std::string>& value) -> Json::Value {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

}  // namespace

auto to_string(SortDirection direction) -> std::string_view {
    switch (direction) {
        case SortDirection::None:
            return "none";
        case SortDirection::Ascending:
            return "asc";
        case SortDirection::Descending:
            return "desc";
    }
    return "none";
}

auto merge_table_state(const Json::Value& raw) -> MergedTableState {
    MergedTableState merged;
    if (!raw.isObject()) {
        if (!raw.isNull()) {
            merged.meta.warnings.emplace_back("table state: expected an object, using defaults");
        }
        return merged;
    }
    merged.meta.source_ok = true;

    if (raw.isMember("sort") && !raw["sort"].isNull()) {
        read_sort(raw["sort"], merged.state.sort, merged.meta.warnings);
    }
    if (raw.isMember("filters") && !raw["filters"].isNull()) {
        read_filters(raw["filters"], merged.state.filters, merged.meta.warnings);
    }
    if (raw.isMember("group") && !raw["group"].isNull()) {
        read_group(raw["group"], merged.state.group, merged.meta.warnings);
    }
    return merged;
}

auto to_json(const TableState& state) -> Json::Value {
    Json::Value out(Json::objectValue);

    Json::Value sort(Json::objectValue);
    sort["controlId"] = optional_string(state.sort.control_id);
    sort["direction"] = state.sort.direction == SortDirection::None
                            ? Json::Value(Json::nullValue)
                            : Json::Value(std::string(to_string(state.sort.direction)));
    out["sort"] = std::move(sort);

    Json::Value filters(Json::objectValue);
    for (const auto& [id, needle] : state.filters) {
        filters[id] = needle;
    }
    out["filters"] = std::move(filters);

    Json::Value group(Json::objectValue);
    group["enabled"] = state.group.enabled;
    group["by"] = optional_string(state.group.by);
    group["sumBy"] = optional_string(state.group.sum_by);
    out["group"] = std::move(group);
    return out;
}

auto canonical_json(const TableState& state) -> std::string {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, to_json(state));
}

}  // namespace tabula::state

#include <tabula/runtime/dropdowns.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace tabula::runtime {

namespace {

auto trim(std::string_view input) -> std::string_view {
    auto start = input.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = input.find_last_not_of(" \t\n\r");
    return input.substr(start, end - start + 1);
}

auto lower(std::string_view input) -> std::string {
    std::string out(trim(input));
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

auto string_of(const Json::Value& json) -> std::optional<std::string> {
    if (json.isString()) {
        return json.asString();
    }
    if (json.isNull() || json.isObject() || json.isArray()) {
        return std::nullopt;
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, json);
}

auto non_empty_string(const Json::Value& obj, const char* name) -> std::optional<std::string> {
    if (!obj.isMember(name) || !obj[name].isString()) {
        return std::nullopt;
    }
    auto text = std::string(trim(obj[name].asString()));
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

auto parse_list(const Json::Value& edit_list) -> DropdownList {
    DropdownList list;
    for (const auto& option : edit_list) {
        if (!option.isObject()) {
            continue;
        }
        auto key = string_of(option["key"]);
        auto value = string_of(option["value"]);
        if (!key || !value) {
            continue;
        }
        list.labels.insert_or_assign(*key, *value);
        list.options.push_back(DropdownOption{.key = std::move(*key), .value = std::move(*value)});
    }
    return list;
}

}  // namespace

auto normalize_language(std::string_view language) -> std::string {
    std::string out(trim(language));
    if (out.empty()) {
        return std::string(kDefaultLanguage);
    }
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return out;
}

auto parse_dropdown_dataset(const Json::Value& dataset, std::string_view language)
    -> DropdownDataset {
    DropdownDataset out;
    if (!dataset.isObject()) {
        return out;
    }
    const auto& root = dataset["ROOT"];
    if (root.isObject() && root["DEFAULT_LANGUAGE"].isString()) {
        out.default_language = normalize_language(root["DEFAULT_LANGUAGE"].asString());
    }

    const auto* section = &dataset[normalize_language(language)];
    if (!section->isObject()) {
        section = &dataset[out.default_language];
    }
    if (!section->isObject()) {
        return out;
    }

    for (const auto& item_id : section->getMemberNames()) {
        const auto& item = (*section)[item_id];
        if (!item.isObject()) {
            continue;
        }
        auto name = non_empty_string(item, "list_name");
        if (!name) {
            name = non_empty_string(item, "name");
        }
        if (!name || !item["edit_list"].isArray()) {
            continue;
        }
        auto list = parse_list(item["edit_list"]);
        if (!list.options.empty()) {
            out.lists.insert_or_assign(lower(*name), std::move(list));
        }
    }
    return out;
}

auto dropdown_source(const Control& control) -> std::optional<DropdownSource> {
    if (control.type != ControlType::Dropdown || !control.attributes.isObject()) {
        return std::nullopt;
    }
    const auto& configs = control.attributes["configs"];
    if (!configs.isObject() || !configs["dropdown"].isObject()) {
        return std::nullopt;
    }
    const auto& config = configs["dropdown"];
    auto key = non_empty_string(config, "key");
    auto field = non_empty_string(config, "feld");
    if (!key || !field) {
        return std::nullopt;
    }
    return DropdownSource{
        .table = non_empty_string(config, "table").value_or(std::string(kDropdownTable)),
        .key = std::move(*key),
        .field = std::move(*field)};
}

auto DropdownCache::cached(const Key& key) const -> DatasetPtr {
    std::lock_guard lock(mutex_);
    if (auto it = entries_.find(key); it != entries_.end()) {
        return it->second;
    }
    return nullptr;
}

auto DropdownCache::load(const Key& key) -> Result<DatasetPtr> {
    const auto& [table, dataset_key, language] = key;
    auto body = lookups_.load_dataset(table, dataset_key);
    if (!body) {
        return std::unexpected(body.error());
    }
    auto parsed = std::make_shared<const DropdownDataset>(
        parse_dropdown_dataset(body->value_or(Json::Value{}), language));
    spdlog::debug("dropdowns: loaded '{}' from '{}' ({}): {} lists", dataset_key, table, language,
                  parsed->lists.size());
    std::lock_guard lock(mutex_);
    entries_.insert_or_assign(key, parsed);
    return parsed;
}

auto DropdownCache::lookup(const DropdownSource& source, std::string_view language)
    -> Result<ResolvedDropdown> {
    const auto lang = normalize_language(language);
    const auto list_name = lower(source.field);

    ResolvedDropdown out;
    out.source = source;
    out.language = lang;

    const Key key{source.table, source.key, lang};
    auto dataset = cached(key);
    if (!dataset || !dataset->lists.contains(list_name)) {
        auto loaded = load(key);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        dataset = std::move(*loaded);
    }
    out.default_language = dataset->default_language;
    if (auto it = dataset->lists.find(list_name); it != dataset->lists.end()) {
        out.list = it->second;
        return out;
    }

    if (dataset->default_language == lang) {
        return out;
    }
    const Key fallback_key{source.table, source.key, dataset->default_language};
    auto fallback = cached(fallback_key);
    if (!fallback || fallback->lists.empty()) {
        auto loaded = load(fallback_key);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        fallback = std::move(*loaded);
    }
    if (auto it = fallback->lists.find(list_name); it != fallback->lists.end()) {
        out.list = it->second;
        out.language = dataset->default_language;
    }
    return out;
}

auto DropdownCache::resolve(std::span<const state::EffectiveControl> controls,
                            std::string_view language, std::vector<std::string>& warnings)
    -> Dropdowns {
    Dropdowns out;
    for (const auto& c : controls) {
        if (c.orphan) {
            continue;
        }
        auto source = dropdown_source(c.control);
        if (!source) {
            continue;
        }
        auto resolved = lookup(*source, language);
        if (!resolved) {
            auto message = fmt::format("dropdown of control '{}' unavailable: {}", c.control.id,
                                       resolved.error().message);
            spdlog::warn("dropdowns: {}", message);
            warnings.push_back(std::move(message));
            continue;
        }
        out.emplace(c.control.id, std::move(*resolved));
    }
    return out;
}

}  // namespace tabula::runtime

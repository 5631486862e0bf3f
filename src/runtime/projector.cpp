#include <tabula/runtime/projector.hpp>

#include <cctype>
#include <iterator>
#include <string>

namespace tabula::runtime {

namespace {

auto lower(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

// Stored SYSTEM fields are matched exactly first, then in lower and upper case.
auto stored_system_field(const Record& record, std::string_view field) -> const FieldValue* {
    for (const auto& [key, value] : record.fields) {
        if (!is_system_group(key.group)) {
            continue;
        }
        if (key.field == field) {
            return &value;
        }
    }
    auto lowered = lower(field);
    for (const auto& [key, value] : record.fields) {
        if (is_system_group(key.group) && lower(key.field) == lowered) {
            return &value;
        }
    }
    return nullptr;
}

}  // namespace

auto select_version(const TemporalMap& versions, Timestamp as_of)
    -> const TemporalMap::value_type* {
    auto it = versions.upper_bound(as_of);
    if (it == versions.begin()) {
        return nullptr;
    }
    return &*std::prev(it);
}

auto system_value(const Record& record, std::string_view field) -> Value {
    auto name = lower(field);
    if (name == "id" || name == "uid") {
        return record.id;
    }
    if (name == "name") {
        return record.name;
    }
    if (name == "created_at") {
        return record.created_at;
    }
    if (name == "modified_at") {
        return record.modified_at;
    }
    if (name == "valid_until" || name == "gilt_bis") {
        return record.valid_until;
    }
    if (name == "retired" || name == "historisch") {
        return record.retired;
    }

    const auto* stored = stored_system_field(record, field);
    if (stored == nullptr) {
        return std::monostate{};
    }
    if (const auto* versions = std::get_if<TemporalMap>(&stored->data)) {
        // SYSTEM is always current: take the newest version regardless of as-of.
        if (versions->empty()) {
            return std::monostate{};
        }
        return versions->rbegin()->second;
    }
    return std::get<Value>(stored->data);
}

auto project_field(const Record& record, const FieldKey& key, Timestamp as_of) -> ProjectedField {
    if (is_system_group(key.group)) {
        return ProjectedField{.value = system_value(record, key.field), .effective_from = {}};
    }
    const auto* stored = record.find(key);
    if (stored == nullptr) {
        return ProjectedField{};
    }
    if (const auto* versions = std::get_if<TemporalMap>(&stored->data)) {
        const auto* selected = select_version(*versions, as_of);
        if (selected == nullptr) {
            return ProjectedField{};
        }
        return ProjectedField{.value = selected->second, .effective_from = selected->first};
    }
    return ProjectedField{.value = std::get<Value>(stored->data), .effective_from = {}};
}

auto project(const Record& record, std::span<const FieldKey> fields, Timestamp as_of)
    -> ProjectedRecord {
    ProjectedRecord out;
    out.record = &record;
    out.fields.reserve(fields.size());
    for (const auto& key : fields) {
        out.fields.push_back(project_field(record, key, as_of));
    }
    return out;
}

}  // namespace tabula::runtime

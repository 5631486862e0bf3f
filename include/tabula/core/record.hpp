#pragma once

#include <tabula/core/time.hpp>
#include <tabula/core/value.hpp>

#include <compare>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tabula {

/// Address of a field inside a record: group name plus field name.
struct FieldKey {
    std::string group;
    std::string field;

    auto operator<=>(const FieldKey&) const = default;
};

}  // namespace tabula

namespace std {

template <>
struct hash<tabula::FieldKey> {
    auto operator()(const tabula::FieldKey& key) const noexcept -> std::size_t {
        auto h = std::hash<std::string>{}(key.group);
        return h ^ (std::hash<std::string>{}(key.field) + 0x9e3779b97f4a7c15ULL + (h << 6) +
                    (h >> 2));
    }
};

}  // namespace std

namespace tabula {

/// Name of the reserved group whose fields come from record metadata.
inline constexpr std::string_view kSystemGroup = "SYSTEM";

/// Case-insensitive check against kSystemGroup.
[[nodiscard]] auto is_system_group(std::string_view group) noexcept -> bool;

/// One row of a source table, decoded at the record-store boundary.
struct Record {
    std::string id;
    std::string name;
    std::unordered_map<FieldKey, FieldValue> fields;
    /// Retirement date; kSentinelMax means open-ended.
    Timestamp valid_until = kSentinelMax;
    Timestamp created_at;
    Timestamp modified_at;
    bool retired = false;

    [[nodiscard]] auto find(const FieldKey& key) const -> const FieldValue* {
        if (auto it = fields.find(key); it != fields.end()) {
            return &it->second;
        }
        return nullptr;
    }

    void set(std::string group, std::string field, FieldValue value) {
        fields.insert_or_assign(FieldKey{.group = std::move(group), .field = std::move(field)},
                                std::move(value));
    }

    auto operator==(const Record&) const -> bool = default;
};

}  // namespace tabula

#pragma once

#include <tabula/core/record.hpp>
#include <tabula/core/time.hpp>
#include <tabula/core/value.hpp>

#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace tabula::runtime {

/// A field resolved for one as-of instant.
struct ProjectedField {
    Value value;
    /// Timestamp of the version that was selected; empty for plain values,
    /// system fields and temporal fields with no qualifying version.
    std::optional<Timestamp> effective_from;
};

/// A record with the requested fields resolved. Field order follows the
/// request passed to project().
struct ProjectedRecord {
    const Record* record = nullptr;
    std::vector<ProjectedField> fields;
};

/// Projection cut-off for an as-of day: every version stamped on that day or
/// earlier qualifies.
[[nodiscard]] constexpr auto as_of_cutoff(Date as_of) noexcept -> Timestamp {
    return end_of_day(as_of);
}

/// Version with the greatest timestamp <= `as_of`, or nullptr when none qualifies.
[[nodiscard]] auto select_version(const TemporalMap& versions, Timestamp as_of)
    -> const TemporalMap::value_type*;

/// Resolve a metadata-backed field of the reserved SYSTEM group.
///
/// Recognised names (case-insensitive): `id`/`uid`, `name`, `created_at`,
/// `modified_at`, `valid_until`/`gilt_bis`, `retired`/`historisch`. Other names
/// fall back to the record's stored SYSTEM fields; null when absent.
[[nodiscard]] auto system_value(const Record& record, std::string_view field) -> Value;

/// Resolve one field of `record` for `as_of`.
[[nodiscard]] auto project_field(const Record& record, const FieldKey& key, Timestamp as_of)
    -> ProjectedField;

/// Resolve `fields` of `record` for `as_of`. Pure; the record is not modified.
[[nodiscard]] auto project(const Record& record, std::span<const FieldKey> fields, Timestamp as_of)
    -> ProjectedRecord;

}  // namespace tabula::runtime

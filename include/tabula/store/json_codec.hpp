#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/record.hpp>
#include <tabula/core/value.hpp>
#include <tabula/core/view.hpp>
#include <tabula/runtime/matrix.hpp>
#include <tabula/store/memory_store.hpp>

#include <json/json.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace tabula::store {

// ─── Parsing ──────────────────────────────────────────────────────────────────

[[nodiscard]] auto parse_json(std::string_view text) -> Result<Json::Value>;

[[nodiscard]] auto read_json_file(const std::filesystem::path& path) -> Result<Json::Value>;

/// Compact single-line rendering.
[[nodiscard]] auto write_compact(const Json::Value& value) -> std::string;

/// Two-space indented rendering.
[[nodiscard]] auto write_pretty(const Json::Value& value) -> std::string;

// ─── Decoding ─────────────────────────────────────────────────────────────────

/// Decode a JSON scalar. Arrays and objects are kept as compact JSON text.
[[nodiscard]] auto decode_value(const Json::Value& json) -> Value;

/// Decode a stored field. Non-empty objects whose keys all parse as
/// timestamps become temporal maps; anything else is a plain value.
[[nodiscard]] auto decode_field(const Json::Value& json) -> FieldValue;

/// Decode a timestamp given as ISO-8601 text or as a legacy day-of-year number.
[[nodiscard]] auto decode_timestamp(const Json::Value& json) -> std::optional<Timestamp>;

/// Decode one record.
///
/// ```json
/// {"id": "...", "name": "...", "created_at": "2024-01-01", "modified_at": "...",
///  "valid_until": "9999-12-31", "retired": false,
///  "fields": {"GROUP": {"FIELD": value | {"<timestamp>": value, ...}}}}
/// ```
///
/// `uid`, `gilt_bis`, `historisch` and `daten` are read as aliases.
[[nodiscard]] auto decode_record(const Json::Value& json) -> Result<Record>;

/// Decode a view definition in its stored shape: a `ROOT` section with
/// `TABLE`, `VIEW_NAME`, `ALLOW_FILTER`, `ALLOW_SORT`, `DEFAULT_SORT_COLUMN`
/// and `ALLOW_TABLE_OVERRIDE`, plus any number of sections mapping control id
/// to control (`gruppe`/`group`, `feld`/`field`, `label`, `type`, `show`,
/// `display_order`, `width`). Other control keys are kept in
/// `Control::attributes`. Controls are ordered by display order, then id.
[[nodiscard]] auto decode_view(std::string view_id, const Json::Value& json)
    -> Result<ViewDefinition>;

// ─── Encoding ─────────────────────────────────────────────────────────────────

/// Timestamps encode as format_timestamp() text; NaN and infinities as null.
[[nodiscard]] auto encode_value(const Value& value) -> Json::Value;

/// `{viewId, name, rootTable, defaultSort, filterable, sortable, controls[]}`.
[[nodiscard]] auto encode_definition(const ViewDefinition& view) -> Json::Value;

/// Matrix page with `rows[]`, `totals`, `controlsEffective[]`, `dropdowns`
/// (control id → `{table, key, feld, map, options[], language,
/// default_language}`) and camelCase `meta`.
[[nodiscard]] auto encode_matrix(const runtime::MatrixResponse& response) -> Json::Value;

// ─── Fixtures ─────────────────────────────────────────────────────────────────

/// In-memory stores populated from one fixture document.
struct Fixture {
    std::unique_ptr<InMemoryViewStore> views = std::make_unique<InMemoryViewStore>();
    std::unique_ptr<InMemoryRecordStore> records = std::make_unique<InMemoryRecordStore>();
    std::unique_ptr<InMemoryStateStore> state = std::make_unique<InMemoryStateStore>();
    std::unique_ptr<InMemoryLookupStore> lookups = std::make_unique<InMemoryLookupStore>();
};

/// Build stores from `{"views": {id: view}, "tables": {name: [record]},
/// "lookups": {table: {key: dataset}},
/// "state": {key: {"controls": {...}, "table_state": {...}}}}`.
[[nodiscard]] auto load_fixture(const Json::Value& json) -> Result<Fixture>;

[[nodiscard]] auto load_fixture_file(const std::filesystem::path& path) -> Result<Fixture>;

}  // namespace tabula::store

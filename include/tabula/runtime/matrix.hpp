#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/time.hpp>
#include <tabula/core/value.hpp>
#include <tabula/runtime/dropdowns.hpp>
#include <tabula/runtime/pipeline.hpp>
#include <tabula/runtime/session.hpp>
#include <tabula/state/controls.hpp>
#include <tabula/state/table_state.hpp>
#include <tabula/store/view_store.hpp>

#include <json/json.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace tabula::runtime {

struct MatrixOptions {
    std::size_t default_page_limit = 200;
    std::size_t max_page_limit = 10'000;
    /// Base-row cap used when the request does not name one.
    std::size_t max_base_rows = 20'000;
    /// Source of the current day for retirement checks and the default as-of.
    std::function<Date()> today = [] { return today_utc(); };
    /// Language of dropdown labels when the request names none.
    std::string language{kDefaultLanguage};
};

struct MatrixRequest {
    std::string view_id;
    /// Caller-chosen table; the view's root table when empty.
    std::optional<std::string> table;
    /// Raw control overrides. Null means "none".
    Json::Value controls_source{Json::nullValue};
    /// Raw table state. Null means "defaults".
    Json::Value table_state_source{Json::nullValue};
    bool include_retired = true;
    std::int64_t limit = 200;
    std::int64_t offset = 0;
    std::optional<Date> as_of;
    std::optional<std::int64_t> max_base_rows;
    std::optional<std::string> language;
};

struct MatrixCell {
    std::string control_id;
    Value value;
    /// Version timestamp of a temporal field, see ProjectedField.
    std::optional<Timestamp> effective_from;
};

enum class MatrixRowKind : std::uint8_t {
    Data,
    Group,
};

struct MatrixRow {
    MatrixRowKind kind = MatrixRowKind::Data;

    // Data rows.
    std::string id;
    std::string name;
    std::vector<MatrixCell> cells;
    /// Set on data rows of a grouped page.
    std::optional<std::string> group_key;

    // Group rows.
    std::string key;
    Value raw;
    std::size_t count = 0;
    std::optional<double> sum;
};

struct MatrixMeta {
    std::size_t max_base_rows = 0;
    std::size_t base_loaded = 0;
    std::size_t total_after_filter = 0;
    std::size_t offset = 0;
    std::size_t limit = 0;
    std::size_t returned_data = 0;
    std::size_t returned_rows = 0;
    bool has_more = false;
    bool cache_hit = false;
    std::uint64_t table_version = 0;
    bool truncated = false;
    std::string totals_scope = "global";
    state::ControlsMeta controls;
    state::TableStateMeta table_state;
    /// Soft failures and sanitizer findings.
    std::vector<std::string> warnings;
};

struct MatrixResponse {
    std::string view_id;
    std::string table;
    Date as_of;
    /// Persistable control overrides after sanitizing.
    state::ControlOverrides controls_source;
    std::vector<state::EffectiveControl> controls;
    state::TableState table_state;
    std::vector<MatrixRow> rows;
    /// Global aggregate; set only when grouping is enabled.
    std::optional<Aggregate> totals;
    /// Options of dropdown controls, keyed by control id. Empty when the
    /// session has no lookup store.
    Dropdowns dropdowns;
    MatrixMeta meta;
};

/// Build one page of a view.
///
/// Pagination and table override are validated before any cache is touched.
/// Sort order, filtering and the global aggregate come from the result cache
/// (computed through run_pipeline() on a miss). Only rows of the page are
/// projected for display. With grouping enabled, group header rows carrying
/// page-local count and sum precede the data rows of each group, in
/// first-seen order. Dropdown controls get their options resolved through the
/// session's dropdown cache; a failing lookup is a warning, not an error.
///
/// Errors: InvalidInput for bad pagination or a rejected table override,
/// NotFound for an unknown view or table, UpstreamUnavailable when the table
/// cannot be loaded and nothing is cached.
[[nodiscard]] auto build_matrix(store::ViewStore& views, SessionCacheStore& session,
                                const MatrixOptions& options, const MatrixRequest& request)
    -> Result<MatrixResponse>;

/// Effective table for a view, or InvalidInput when the override is rejected.
///
/// An override is accepted when it names the root table, when both tables are
/// `sys_` system tables, or when the view allows overrides.
[[nodiscard]] auto resolve_table(const ViewDefinition& view,
                                 const std::optional<std::string>& requested)
    -> Result<std::string>;

/// Print a matrix page as an aligned text table of its visible columns.
void print_matrix(const MatrixResponse& response, std::ostream& out);

}  // namespace tabula::runtime

#pragma once

#include <tabula/core/record.hpp>
#include <tabula/core/time.hpp>
#include <tabula/core/value.hpp>
#include <tabula/core/view.hpp>
#include <tabula/runtime/projector.hpp>
#include <tabula/state/table_state.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tabula::runtime {

/// Count and sum over a set of rows.
struct Aggregate {
    std::size_t count = 0;
    /// Empty when there is no sum control or no row has a numeric value for it.
    std::optional<double> sum;

    auto operator==(const Aggregate&) const -> bool = default;
};

/// Inputs of a pipeline run that do not come from the table state.
struct PipelineContext {
    /// Projection cut-off, see as_of_cutoff().
    Timestamp as_of = as_of_cutoff(today_utc());
    /// Day against which retirement is evaluated.
    Date today = today_utc();
    bool filterable = true;
    bool sortable = true;
    /// Control sorted ascending when the state carries no sort.
    std::optional<std::string> default_sort;
};

struct PipelineResult {
    /// Record ids after exclusion, filtering and sorting.
    std::vector<std::string> ordered_ids;
    /// Rows after filtering.
    std::size_t total = 0;
    /// Rows after exclusion, before filtering.
    std::size_t base_loaded = 0;
    /// Global aggregate over the filtered set; only computed with grouping enabled.
    std::optional<Aggregate> aggregate;
};

/// True for ids that normalise (lower-case, dashes removed) to 32 zeros,
/// fives or sixes. Those rows hold system metadata and are never listed.
[[nodiscard]] auto is_reserved_id(std::string_view id) -> bool;

/// True when the record's retirement day lies strictly before `today`.
/// Retirement dates at or after kSentinelMax never retire.
[[nodiscard]] auto is_retired_before(const Record& record, Date today) noexcept -> bool;

/// Emptiness of a projected value for a declared control type.
///
///   - null and blank strings are empty for every type but Boolean
///   - String, Dropdown: otherwise never empty
///   - Number: empty unless numeric and not NaN
///   - Date, DateTime: empty when equal to kSentinelMin
///   - Boolean: never empty
[[nodiscard]] auto is_empty_value(const Value& value, ControlType type) -> bool;

/// A row is empty when every non-system control projects to an empty value.
/// `projected.fields` must line up with `controls`.
[[nodiscard]] auto is_empty_row(const ProjectedRecord& projected,
                                std::span<const Control> controls) -> bool;

/// Exclude, filter, sort and aggregate `rows`.
///
/// Stages, in order:
///   1. exclusion of reserved ids, records retired before `context.today`
///      and empty rows
///   2. AND of case-insensitive substring filters; filters on unknown
///      controls are skipped
///   3. stable single-column sort: numeric values first (compared as
///      numbers), then the rest as case-sensitive strings
///   4. global aggregate when grouping is enabled
///
/// Filters are ignored when `context.filterable` is false and sorting when
/// `context.sortable` is false.
[[nodiscard]] auto run_pipeline(std::span<const Record> rows, std::span<const Control> controls,
                                const state::TableState& state, const PipelineContext& context)
    -> PipelineResult;

}  // namespace tabula::runtime

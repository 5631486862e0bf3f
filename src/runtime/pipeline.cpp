#include <tabula/runtime/pipeline.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace tabula::runtime {

namespace {

// Legacy day-of-year encoding of kSentinelMin (year 1, day 1).
constexpr double kLegacyEmptyDate = 1001.0;

auto lower(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

auto find_control(std::span<const Control> controls, std::string_view id)
    -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < controls.size(); ++i) {
        if (controls[i].id == id) {
            return i;
        }
    }
    return std::nullopt;
}

auto numeric(const Value& value) -> std::optional<double> {
    auto n = as_number(value);
    if (n && !std::isnan(*n)) {
        return n;
    }
    return std::nullopt;
}

struct SortKey {
    bool is_number = false;
    double number = 0.0;
    std::string text;
};

auto make_sort_key(const Value& value) -> SortKey {
    if (auto n = numeric(value)) {
        return SortKey{.is_number = true, .number = *n, .text = {}};
    }
    return SortKey{.is_number = false, .number = 0.0, .text = to_display_string(value)};
}

auto key_less(const SortKey& lhs, const SortKey& rhs) -> bool {
    if (lhs.is_number != rhs.is_number) {
        return lhs.is_number;
    }
    if (lhs.is_number) {
        return lhs.number < rhs.number;
    }
    return lhs.text < rhs.text;
}

struct ActiveFilter {
    std::size_t control = 0;
    std::string needle;
};

auto active_filters(std::span<const Control> controls, const state::TableState& state)
    -> std::vector<ActiveFilter> {
    std::vector<ActiveFilter> out;
    for (const auto& [id, needle] : state.filters) {
        auto index = find_control(controls, id);
        if (!index) {
            spdlog::debug("pipeline: filter on unknown control '{}' skipped", id);
            continue;
        }
        if (needle.empty()) {
            continue;
        }
        out.push_back(ActiveFilter{.control = *index, .needle = lower(needle)});
    }
    return out;
}

struct ResolvedSort {
    std::size_t control = 0;
    bool descending = false;
};

auto resolve_sort(std::span<const Control> controls, const state::TableState& state,
                  const PipelineContext& context) -> std::optional<ResolvedSort> {
    if (!context.sortable) {
        return std::nullopt;
    }
    const auto& sort = state.sort;
    if (sort.active()) {
        if (auto index = find_control(controls, *sort.control_id)) {
            return ResolvedSort{.control = *index,
                                .descending = sort.direction == state::SortDirection::Descending};
        }
        spdlog::debug("pipeline: sort on unknown control '{}' skipped", *sort.control_id);
        return std::nullopt;
    }
    if (context.default_sort) {
        if (auto index = find_control(controls, *context.default_sort)) {
            return ResolvedSort{.control = *index, .descending = false};
        }
    }
    return std::nullopt;
}

}  // namespace

auto is_reserved_id(std::string_view id) -> bool {
    std::string hex;
    hex.reserve(32);
    for (char ch : id) {
        if (ch == '-') {
            continue;
        }
        hex.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (hex.size() != 32) {
        return false;
    }
    for (char digit : {'0', '5', '6'}) {
        if (std::all_of(hex.begin(), hex.end(), [digit](char ch) { return ch == digit; })) {
            return true;
        }
    }
    return false;
}

auto is_retired_before(const Record& record, Date today) noexcept -> bool {
    if (record.valid_until >= kSentinelMax) {
        return false;
    }
    return day_of(record.valid_until) < today;
}

auto is_empty_value(const Value& value, ControlType type) -> bool {
    if (type == ControlType::Boolean) {
        return false;
    }
    if (is_blank(value)) {
        return true;
    }
    switch (type) {
        case ControlType::String:
        case ControlType::Dropdown:
        case ControlType::Boolean:
            return false;
        case ControlType::Number:
            return !numeric(value).has_value();
        case ControlType::Date:
        case ControlType::DateTime: {
            if (const auto* ts = std::get_if<Timestamp>(&value)) {
                return *ts == kSentinelMin;
            }
            if (const auto* text = std::get_if<std::string>(&value)) {
                auto parsed = parse_timestamp(*text);
                return parsed && *parsed == kSentinelMin;
            }
            auto n = as_number(value);
            return n && *n == kLegacyEmptyDate;
        }
    }
    return false;
}

auto is_empty_row(const ProjectedRecord& projected, std::span<const Control> controls) -> bool {
    for (std::size_t i = 0; i < controls.size(); ++i) {
        if (controls[i].is_system()) {
            continue;
        }
        if (!is_empty_value(projected.fields[i].value, controls[i].type)) {
            return false;
        }
    }
    return true;
}

auto run_pipeline(std::span<const Record> rows, std::span<const Control> controls,
                  const state::TableState& state, const PipelineContext& context)
    -> PipelineResult {
    std::vector<FieldKey> fields;
    fields.reserve(controls.size());
    for (const auto& control : controls) {
        fields.push_back(control.source);
    }

    // ─── Exclude ─────────────────────────────────────────────────────────────
    std::vector<ProjectedRecord> base;
    base.reserve(rows.size());
    for (const auto& record : rows) {
        if (is_reserved_id(record.id) || is_retired_before(record, context.today)) {
            continue;
        }
        auto projected = project(record, fields, context.as_of);
        if (is_empty_row(projected, controls)) {
            continue;
        }
        base.push_back(std::move(projected));
    }

    PipelineResult result;
    result.base_loaded = base.size();

    // ─── Filter ──────────────────────────────────────────────────────────────
    std::vector<std::size_t> idx;
    idx.reserve(base.size());
    auto filters =
        context.filterable ? active_filters(controls, state) : std::vector<ActiveFilter>{};
    for (std::size_t row = 0; row < base.size(); ++row) {
        bool keep = true;
        for (const auto& filter : filters) {
            auto haystack = lower(to_display_string(base[row].fields[filter.control].value));
            if (haystack.find(filter.needle) == std::string::npos) {
                keep = false;
                break;
            }
        }
        if (keep) {
            idx.push_back(row);
        }
    }
    result.total = idx.size();

    // ─── Sort ────────────────────────────────────────────────────────────────
    if (auto sort = resolve_sort(controls, state, context)) {
        std::vector<SortKey> keys(base.size());
        for (auto row : idx) {
            keys[row] = make_sort_key(base[row].fields[sort->control].value);
        }
        auto compare_row = [&](std::size_t lhs, std::size_t rhs) -> bool {
            return sort->descending ? key_less(keys[rhs], keys[lhs])
                                    : key_less(keys[lhs], keys[rhs]);
        };
        std::stable_sort(idx.begin(), idx.end(), compare_row);
    }

    result.ordered_ids.reserve(idx.size());
    for (auto row : idx) {
        result.ordered_ids.push_back(base[row].record->id);
    }

    // ─── Aggregate ───────────────────────────────────────────────────────────
    if (state.group.enabled) {
        Aggregate aggregate{.count = result.total, .sum = std::nullopt};
        if (state.group.sum_by) {
            if (auto sum_index = find_control(controls, *state.group.sum_by)) {
                for (auto row : idx) {
                    if (auto n = numeric(base[row].fields[*sum_index].value)) {
                        aggregate.sum = aggregate.sum.value_or(0.0) + *n;
                    }
                }
            }
        }
        result.aggregate = aggregate;
    }

    return result;
}

}  // namespace tabula::runtime

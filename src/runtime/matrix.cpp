#include <tabula/runtime/matrix.hpp>
#include <tabula/runtime/projector.hpp>

#include <fmt/format.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <ostream>

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

auto is_identifier(std::string_view name) -> bool {
    if (name.empty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char ch) {
        return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
               ch == '_';
    });
}

auto is_system_table(std::string_view name) -> bool {
    return name.size() > 4 && name.substr(0, 4) == "sys_";
}

auto control_index(std::span<const Control> controls, const std::optional<std::string>& id)
    -> std::optional<std::size_t> {
    if (!id) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < controls.size(); ++i) {
        if (controls[i].id == *id) {
            return i;
        }
    }
    return std::nullopt;
}

auto make_data_row(const Record& record, std::span<const Control> controls,
                   std::span<const FieldKey> fields, Timestamp as_of) -> MatrixRow {
    auto projected = project(record, fields, as_of);
    MatrixRow row;
    row.kind = MatrixRowKind::Data;
    row.id = record.id;
    row.name = record.name;
    row.cells.reserve(controls.size());
    for (std::size_t i = 0; i < controls.size(); ++i) {
        row.cells.push_back(MatrixCell{.control_id = controls[i].id,
                                       .value = std::move(projected.fields[i].value),
                                       .effective_from = projected.fields[i].effective_from});
    }
    return row;
}

// Group header rows with page-local totals, each followed by its data rows.
auto group_page(std::vector<MatrixRow> data, std::size_t by, std::optional<std::size_t> sum_by)
    -> std::vector<MatrixRow> {
    struct Bucket {
        MatrixRow header;
        std::vector<MatrixRow> items;
    };
    std::vector<Bucket> buckets;
    robin_hood::unordered_flat_map<std::string, std::size_t> bucket_of;

    for (auto& row : data) {
        const auto& cell = row.cells[by];
        auto key = to_display_string(cell.value);
        auto [it, inserted] = bucket_of.try_emplace(key, buckets.size());
        if (inserted) {
            Bucket bucket;
            bucket.header.kind = MatrixRowKind::Group;
            bucket.header.key = key;
            bucket.header.raw = cell.value;
            buckets.push_back(std::move(bucket));
        }
        auto& bucket = buckets[it->second];
        ++bucket.header.count;
        if (sum_by) {
            auto n = as_number(row.cells[*sum_by].value);
            if (n && !std::isnan(*n)) {
                bucket.header.sum = bucket.header.sum.value_or(0.0) + *n;
            }
        }
        row.group_key = std::move(key);
        bucket.items.push_back(std::move(row));
    }

    std::vector<MatrixRow> out;
    out.reserve(data.size() + buckets.size());
    for (auto& bucket : buckets) {
        out.push_back(std::move(bucket.header));
        for (auto& item : bucket.items) {
            out.push_back(std::move(item));
        }
    }
    return out;
}

}  // namespace

auto resolve_table(const ViewDefinition& view, const std::optional<std::string>& requested)
    -> Result<std::string> {
    const auto root = std::string(trim(view.root_table));
    if (root.empty()) {
        return invalid_input(fmt::format("view '{}' has no root table", view.id));
    }
    if (!requested) {
        return root;
    }
    auto table = std::string(trim(*requested));
    if (table.empty()) {
        return root;
    }
    if (!is_identifier(table)) {
        return invalid_input(fmt::format("invalid table name '{}'", table));
    }
    if (table == root || view.allow_table_override ||
        (is_system_table(table) && is_system_table(root))) {
        return table;
    }
    return invalid_input(
        fmt::format("view '{}' cannot be pointed at table '{}' (root table is '{}')", view.id,
                    table, root));
}

auto build_matrix(store::ViewStore& views, SessionCacheStore& session,
                  const MatrixOptions& options, const MatrixRequest& request)
    -> Result<MatrixResponse> {
    if (request.limit < 1 || static_cast<std::uint64_t>(request.limit) > options.max_page_limit) {
        return invalid_input(fmt::format("limit must be between 1 and {}, got {}",
                                         options.max_page_limit, request.limit));
    }
    if (request.offset < 0) {
        return invalid_input(fmt::format("offset must not be negative, got {}", request.offset));
    }
    if (request.max_base_rows && *request.max_base_rows < 1) {
        return invalid_input(
            fmt::format("maxBaseRows must be positive, got {}", *request.max_base_rows));
    }

    auto view = views.load_view(request.view_id);
    if (!view) {
        return std::unexpected(view.error());
    }
    auto table = resolve_table(*view, request.table);
    if (!table) {
        return std::unexpected(table.error());
    }

    MatrixResponse response;
    response.view_id = view->id;
    response.table = *table;
    auto& meta = response.meta;

    auto sanitized = state::sanitize_control_overrides(request.controls_source);
    auto merged = state::merge_controls(view->controls, sanitized.overrides);
    response.controls_source =
        state::normalize_controls_source(sanitized.overrides, merged.controls);
    response.controls = std::move(merged.controls);
    meta.controls = merged.meta;

    auto table_state = state::merge_table_state(request.table_state_source);
    response.table_state = table_state.state;
    meta.table_state = table_state.meta;

    meta.warnings = std::move(sanitized.warnings);
    meta.warnings.insert(meta.warnings.end(), table_state.meta.warnings.begin(),
                         table_state.meta.warnings.end());
    for (const auto& warning : meta.warnings) {
        spdlog::warn("view '{}': {}", view->id, warning);
    }

    if (auto* dropdowns = session.dropdowns()) {
        response.dropdowns = dropdowns->resolve(
            response.controls, request.language.value_or(options.language), meta.warnings);
    }

    auto requested_cap = request.max_base_rows
                             ? static_cast<std::size_t>(*request.max_base_rows)
                             : options.max_base_rows;
    auto cap = session.tables().effective_cap(requested_cap);
    meta.max_base_rows = cap;

    auto handle = session.tables().ensure(*table, request.include_retired, cap);
    if (!handle) {
        return std::unexpected(handle.error());
    }
    const auto& snapshot = *handle->snapshot;
    if (handle->version_changed()) {
        session.results().drop_stale(*table, handle->version());
    }
    meta.warnings.insert(meta.warnings.end(), handle->warnings.begin(), handle->warnings.end());
    meta.table_version = snapshot.version;
    meta.truncated = snapshot.truncated || snapshot.rows.size() > cap;

    const auto today = options.today();
    response.as_of = request.as_of.value_or(today);
    const PipelineContext context{.as_of = as_of_cutoff(response.as_of),
                                  .today = today,
                                  .filterable = view->filterable,
                                  .sortable = view->sortable,
                                  .default_sort = view->default_sort};

    auto key = make_result_key(ResultKeyParts{.view_id = view->id,
                                              .table = *table,
                                              .table_version = snapshot.version,
                                              .include_retired = request.include_retired,
                                              .as_of = response.as_of,
                                              .today = today,
                                              .cap = cap,
                                              .state = response.table_state});
    std::span<const Control> controls = view->controls;
    // A snapshot loaded for a larger cap still serves only the newest `cap` rows.
    std::span<const Record> base(snapshot.rows.data(), std::min(cap, snapshot.rows.size()));
    auto lookup = session.results().get_or_compute(key, *table, snapshot.version, [&] {
        return run_pipeline(base, controls, response.table_state, context);
    });
    const auto& result = lookup.entry->result;
    meta.cache_hit = lookup.hit;
    meta.base_loaded = result.base_loaded;
    meta.total_after_filter = result.total;

    // ─── Page ────────────────────────────────────────────────────────────────
    const auto offset = static_cast<std::size_t>(request.offset);
    const auto limit = static_cast<std::size_t>(request.limit);
    meta.offset = offset;
    meta.limit = limit;
    meta.has_more = offset + limit < result.total;

    std::vector<FieldKey> fields;
    fields.reserve(controls.size());
    for (const auto& control : controls) {
        fields.push_back(control.source);
    }

    std::vector<MatrixRow> page;
    const auto& ids = result.ordered_ids;
    for (std::size_t i = offset; i < ids.size() && i < offset + limit; ++i) {
        const auto* record = snapshot.find(ids[i]);
        if (record == nullptr) {
            continue;
        }
        page.push_back(make_data_row(*record, controls, fields, context.as_of));
    }
    meta.returned_data = page.size();

    const auto& group = response.table_state.group;
    if (group.enabled) {
        response.totals = result.aggregate;
        if (auto by = control_index(controls, group.by)) {
            page = group_page(std::move(page), *by, control_index(controls, group.sum_by));
        }
    }
    meta.returned_rows = page.size();
    response.rows = std::move(page);

    spdlog::debug("matrix '{}' on '{}': {} of {} rows from offset {} (cache_hit={}, v{})",
                  view->id, *table, meta.returned_data, meta.total_after_filter, offset,
                  meta.cache_hit, meta.table_version);
    return response;
}

void print_matrix(const MatrixResponse& response, std::ostream& out) {
    std::vector<const state::EffectiveControl*> columns;
    for (const auto& c : response.controls) {
        if (c.control.show && !c.orphan) {
            columns.push_back(&c);
        }
    }
    std::stable_sort(columns.begin(), columns.end(), [](const auto* lhs, const auto* rhs) {
        return lhs->control.display_order < rhs->control.display_order;
    });

    // Map visible columns to their cell position in data rows.
    std::vector<std::size_t> cell_of(columns.size(), 0);
    for (std::size_t c = 0; c < columns.size(); ++c) {
        for (std::size_t i = 0; i < response.controls.size(); ++i) {
            if (&response.controls[i] == columns[c]) {
                cell_of[c] = i;
            }
        }
    }

    if (columns.empty()) {
        out << "(no visible columns)\n";
        return;
    }

    // Collect all cell strings and compute column widths.
    std::vector<std::size_t> widths(columns.size());
    std::vector<std::vector<std::string>> cells(columns.size());
    for (std::size_t c = 0; c < columns.size(); ++c) {
        const auto& control = columns[c]->control;
        widths[c] = (control.label.empty() ? control.id : control.label).size();
        for (const auto& row : response.rows) {
            if (row.kind != MatrixRowKind::Data) {
                continue;
            }
            auto s = cell_of[c] < row.cells.size() ? to_display_string(row.cells[cell_of[c]].value)
                                                   : std::string{};
            widths[c] = std::max(widths[c], s.size());
            cells[c].push_back(std::move(s));
        }
    }

    // Header row.
    for (std::size_t c = 0; c < columns.size(); ++c) {
        if (c > 0)
            out << "  ";
        const auto& control = columns[c]->control;
        out << fmt::format("{:<{}}", control.label.empty() ? control.id : control.label,
                           widths[c]);
    }
    out << "\n";

    // Separator.
    for (std::size_t c = 0; c < columns.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << std::string(widths[c], '-');
    }
    out << "\n";

    // Data and group rows.
    std::size_t data_row = 0;
    for (const auto& row : response.rows) {
        if (row.kind == MatrixRowKind::Group) {
            out << fmt::format("[{}] count={}", row.key.empty() ? "(empty)" : row.key, row.count);
            if (row.sum) {
                out << fmt::format(" sum={}", *row.sum);
            }
            out << "\n";
            continue;
        }
        for (std::size_t c = 0; c < columns.size(); ++c) {
            if (c > 0)
                out << "  ";
            out << fmt::format("{:<{}}", cells[c][data_row], widths[c]);
        }
        out << "\n";
        ++data_row;
    }

    const auto& meta = response.meta;
    out << fmt::format("({} of {} rows, offset {}{})\n", meta.returned_data,
                       meta.total_after_filter, meta.offset, meta.has_more ? ", more" : "");
    if (response.totals) {
        out << fmt::format("totals: count={}", response.totals->count);
        if (response.totals->sum) {
            out << fmt::format(" sum={}", *response.totals->sum);
        }
        out << "\n";
    }
}

}  // namespace tabula::runtime

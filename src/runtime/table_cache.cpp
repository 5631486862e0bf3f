#include <tabula/runtime/table_cache.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace tabula::runtime {

namespace {

auto max_modified(const std::vector<Record>& rows, Timestamp floor) -> Timestamp {
    for (const auto& row : rows) {
        floor = std::max(floor, row.modified_at);
    }
    return floor;
}

// Sort modified-desc then id, drop duplicate ids (newest wins) and index.
auto build_snapshot(std::string table, bool include_retired, std::vector<Record> rows,
                    Timestamp watermark, std::uint64_t version, std::size_t cap, bool truncated)
    -> std::shared_ptr<TableSnapshot> {
    std::stable_sort(rows.begin(), rows.end(), [](const Record& lhs, const Record& rhs) {
        if (lhs.modified_at != rhs.modified_at) {
            return lhs.modified_at > rhs.modified_at;
        }
        return lhs.id < rhs.id;
    });

    auto snapshot = std::make_shared<TableSnapshot>();
    snapshot->table = std::move(table);
    snapshot->include_retired = include_retired;
    snapshot->rows.reserve(rows.size());
    snapshot->index.reserve(rows.size());
    for (auto& row : rows) {
        if (snapshot->index.count(row.id) != 0) {
            continue;
        }
        snapshot->index.emplace(row.id, snapshot->rows.size());
        snapshot->rows.push_back(std::move(row));
    }
    snapshot->watermark = max_modified(snapshot->rows, watermark);
    snapshot->version = version;
    snapshot->cap = cap;
    snapshot->truncated = truncated;
    return snapshot;
}

}  // namespace

TableCache::TableCache(store::RecordStore& store, TableCacheOptions options, Clock clock)
    : store_(store), options_(options), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
    if (options_.max_rows == 0) {
        options_.max_rows = 1;
    }
    if (options_.chunk_size == 0) {
        options_.chunk_size = 1;
    }
}

auto TableCache::effective_cap(std::size_t requested_cap) const noexcept -> std::size_t {
    return std::clamp<std::size_t>(requested_cap, 1, options_.max_rows);
}

auto TableCache::peek(const std::string& table, bool include_retired) const -> SnapshotPtr {
    std::lock_guard lock(mutex_);
    if (auto it = entries_.find(Key{table, include_retired}); it != entries_.end()) {
        return it->second.snapshot;
    }
    return nullptr;
}

auto TableCache::ensure(const std::string& table, bool include_retired,
                        std::size_t requested_cap) -> Result<CacheHandle> {
    enum class Action : std::uint8_t { Serve, Full, Delta };

    const auto cap = effective_cap(requested_cap);
    const Key key{table, include_retired};
    const auto now = clock_();

    Action action = Action::Serve;
    SnapshotPtr current;
    {
        std::lock_guard lock(mutex_);
        auto& entry = entries_[key];
        current = entry.snapshot;
        if (!current || current->cap < cap) {
            action = Action::Full;
        } else if (now >= entry.next_eligible_refresh) {
            action = Action::Delta;
        }
        if (action != Action::Serve) {
            entry.next_eligible_refresh = now + options_.refresh_interval;
        }
    }

    CacheHandle handle;
    handle.previous_version = current ? current->version : 0;

    if (action == Action::Serve) {
        handle.snapshot = std::move(current);
        return handle;
    }

    if (action == Action::Full) {
        auto load = load_full(table, include_retired, cap);
        if (!load) {
            if (current) {
                auto message = fmt::format("reload of table '{}' failed, serving cached rows: {}",
                                           table, load.error().message);
                spdlog::warn("table cache: {}", message);
                handle.warnings.push_back(std::move(message));
                handle.snapshot = std::move(current);
                return handle;
            }
            if (load.error().kind == ErrorKind::NotFound) {
                return std::unexpected(load.error());
            }
            return upstream_unavailable(
                fmt::format("loading table '{}': {}", table, load.error().message));
        }
        handle.snapshot = install_full(key, std::move(*load), cap);
        return handle;
    }

    auto changed = store_.fetch_changed_since(table, store::RecordWhere{.include_retired = true},
                                              current->watermark, store::RecordOrder::ModifiedAsc);
    if (!changed) {
        auto message = fmt::format("delta refresh of table '{}' failed, serving cached rows: {}",
                                   table, changed.error().message);
        spdlog::warn("table cache: {}", message);
        handle.warnings.push_back(std::move(message));
        handle.snapshot = std::move(current);
        return handle;
    }
    handle.snapshot = install_delta(key, std::move(*changed));
    return handle;
}

auto TableCache::load_full(const std::string& table, bool include_retired, std::size_t cap)
    -> Result<FullLoad> {
    const store::RecordWhere where{.include_retired = include_retired};
    // One row past the cap tells a truncated load from an exact fit.
    const auto want = cap + 1;

    FullLoad out;
    std::size_t offset = 0;
    while (out.rows.size() < want) {
        auto chunk = std::min(options_.chunk_size, want - out.rows.size());
        auto page = store_.fetch_page(table, where, store::RecordOrder::ModifiedDesc, chunk, offset);
        if (!page) {
            return std::unexpected(page.error());
        }
        auto got = page->size();
        out.rows.insert(out.rows.end(), std::make_move_iterator(page->begin()),
                        std::make_move_iterator(page->end()));
        offset += got;
        if (got < chunk) {
            break;
        }
    }
    if (out.rows.size() > cap) {
        out.truncated = true;
        out.rows.erase(out.rows.begin() + static_cast<std::ptrdiff_t>(cap), out.rows.end());
    }
    spdlog::debug("table cache: full load of '{}' (retired={}): {} rows, cap {}, truncated={}",
                  table, include_retired, out.rows.size(), cap, out.truncated);
    return out;
}

auto TableCache::install_full(const Key& key, FullLoad load, std::size_t cap) -> SnapshotPtr {
    std::lock_guard lock(mutex_);
    auto& entry = entries_[key];
    const auto current = entry.snapshot;

    // A concurrent reload at a larger cap already finished.
    if (current && current->cap > cap) {
        return current;
    }

    auto loaded_watermark = max_modified(load.rows, kSentinelMin);
    std::uint64_t version = load.rows.empty() ? 0 : 1;
    Timestamp watermark = loaded_watermark;
    if (current) {
        // Keep rows a concurrent delta saw after this load read its pages.
        for (const auto& row : current->rows) {
            if (row.modified_at > loaded_watermark) {
                load.rows.push_back(row);
            }
        }
        watermark = std::max(watermark, current->watermark);
        version = current->version;
    }

    auto snapshot = build_snapshot(key.first, key.second, std::move(load.rows), watermark, version,
                                   cap, load.truncated);
    if (current && snapshot->rows != current->rows) {
        snapshot->version = current->version + 1;
    }
    entry.snapshot = snapshot;
    entry.last_refresh = clock_();
    return snapshot;
}

auto TableCache::install_delta(const Key& key, std::vector<Record> changed) -> SnapshotPtr {
    std::lock_guard lock(mutex_);
    auto& entry = entries_[key];
    entry.last_refresh = clock_();
    const auto current = entry.snapshot;
    if (!current || changed.empty()) {
        return current;
    }

    const bool include_retired = key.second;
    auto rows = current->rows;
    robin_hood::unordered_flat_set<std::string> dropped;
    bool any_change = false;
    Timestamp watermark = current->watermark;

    for (auto& record : changed) {
        watermark = std::max(watermark, record.modified_at);
        const bool keep = include_retired || !record.retired;
        if (auto it = current->index.find(record.id); it != current->index.end()) {
            auto& existing = rows[it->second];
            if (record.modified_at <= existing.modified_at) {
                continue;
            }
            if (keep) {
                existing = std::move(record);
            } else {
                dropped.insert(record.id);
            }
            any_change = true;
        } else if (keep) {
            rows.push_back(std::move(record));
            any_change = true;
        }
    }

    if (!any_change && watermark == current->watermark) {
        return current;
    }
    if (!dropped.empty()) {
        std::erase_if(rows, [&](const Record& row) { return dropped.count(row.id) != 0; });
    }

    auto version = any_change ? current->version + 1 : current->version;
    auto snapshot = build_snapshot(key.first, key.second, std::move(rows), watermark, version,
                                   current->cap, current->truncated);
    spdlog::debug("table cache: delta of '{}' (retired={}): {} rows fetched, version {} -> {}",
                  key.first, key.second, changed.size(), current->version, snapshot->version);
    entry.snapshot = snapshot;
    return snapshot;
}

}  // namespace tabula::runtime

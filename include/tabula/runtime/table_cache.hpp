#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/record.hpp>
#include <tabula/core/time.hpp>
#include <tabula/store/record_store.hpp>

#include <robin_hood.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace tabula::runtime {

struct TableCacheOptions {
    /// Hard ceiling on rows loaded by a full load, whatever the caller asks for.
    std::size_t max_rows = 20'000;
    /// Page size of a full load.
    std::size_t chunk_size = 2'000;
    /// Minimum time between two delta refreshes of the same entry.
    std::chrono::milliseconds refresh_interval{2'000};
};

/// Immutable rows of one (table, include-retired) pair at some completed refresh.
struct TableSnapshot {
    std::string table;
    bool include_retired = true;
    /// Ordered by modified-at descending, then id.
    std::vector<Record> rows;
    robin_hood::unordered_flat_map<std::string, std::size_t> index;
    /// Greatest modified-at seen so far.
    Timestamp watermark = kSentinelMin;
    /// Bumped whenever a refresh changes at least one record. Never decreases.
    std::uint64_t version = 0;
    /// Row cap of the last full load.
    std::size_t cap = 0;
    /// True when the last full load stopped at `cap` with rows left in the source.
    bool truncated = false;

    [[nodiscard]] auto find(const std::string& id) const -> const Record* {
        if (auto it = index.find(id); it != index.end()) {
            return &rows[it->second];
        }
        return nullptr;
    }
};

using SnapshotPtr = std::shared_ptr<const TableSnapshot>;

/// What ensure() hands back: a snapshot plus what happened while getting it.
struct CacheHandle {
    SnapshotPtr snapshot;
    /// Version the entry had before this call (0 on cold start).
    std::uint64_t previous_version = 0;
    /// Soft failures, e.g. a delta refresh that could not reach the store.
    std::vector<std::string> warnings;

    [[nodiscard]] auto version() const noexcept -> std::uint64_t { return snapshot->version; }
    [[nodiscard]] auto version_changed() const noexcept -> bool {
        return snapshot->version != previous_version;
    }
};

/// Full/delta cache of table rows shared by every request of a session.
///
/// The first ensure() of a (table, include-retired) pair pages the table in
/// modified-desc order up to the cap. Later calls fetch only rows modified
/// after the watermark, at most once per refresh interval. A request for a
/// larger cap than a truncated snapshot was loaded with triggers a full
/// reload.
///
/// Store calls run outside the lock; the refresh gate is checked and
/// advanced under it. Readers get the snapshot of some completed refresh, so
/// data is at most one refresh interval stale.
class TableCache {
   public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    TableCache(store::RecordStore& store, TableCacheOptions options, Clock clock = {});

    TableCache(const TableCache&) = delete;
    TableCache& operator=(const TableCache&) = delete;

    /// Return a fresh enough snapshot of `table`.
    ///
    /// Fails only when there is no snapshot to fall back on: with the store's
    /// NotFound for unknown tables, otherwise with UpstreamUnavailable.
    [[nodiscard]] auto ensure(const std::string& table, bool include_retired,
                              std::size_t requested_cap) -> Result<CacheHandle>;

    /// Current snapshot without refreshing, or nullptr.
    [[nodiscard]] auto peek(const std::string& table, bool include_retired) const -> SnapshotPtr;

    [[nodiscard]] auto options() const noexcept -> const TableCacheOptions& { return options_; }

    /// Cap actually used for a caller request: clamped to [1, max_rows].
    [[nodiscard]] auto effective_cap(std::size_t requested_cap) const noexcept -> std::size_t;

   private:
    using Key = std::pair<std::string, bool>;

    struct Entry {
        SnapshotPtr snapshot;
        std::chrono::steady_clock::time_point last_refresh{};
        std::chrono::steady_clock::time_point next_eligible_refresh{};
    };

    struct FullLoad {
        std::vector<Record> rows;
        bool truncated = false;
    };

    [[nodiscard]] auto load_full(const std::string& table, bool include_retired, std::size_t cap)
        -> Result<FullLoad>;

    [[nodiscard]] auto install_full(const Key& key, FullLoad load, std::size_t cap)
        -> SnapshotPtr;

    [[nodiscard]] auto install_delta(const Key& key, std::vector<Record> changed) -> SnapshotPtr;

    store::RecordStore& store_;
    TableCacheOptions options_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::map<Key, Entry> entries_;
};

}  // namespace tabula::runtime

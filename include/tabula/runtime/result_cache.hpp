#pragma once

#include <tabula/core/time.hpp>
#include <tabula/runtime/pipeline.hpp>
#include <tabula/state/table_state.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tabula::runtime {

/// 64-bit FNV-1a.
[[nodiscard]] constexpr auto fnv1a64(std::string_view data) noexcept -> std::uint64_t {
    std::uint64_t hash = 0xcbf29ce484222325ULL;
    for (char ch : data) {
        hash ^= static_cast<unsigned char>(ch);
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

/// Everything a pipeline result depends on.
struct ResultKeyParts {
    std::string view_id;
    std::string table;
    std::uint64_t table_version = 0;
    bool include_retired = true;
    Date as_of;
    Date today;
    std::size_t cap = 0;
    state::TableState state;
};

/// `view:table:version:retired:as_of:today:cap:statehash`.
[[nodiscard]] auto make_result_key(const ResultKeyParts& parts) -> std::string;

struct CachedResult {
    PipelineResult result;
    std::string table;
    std::uint64_t table_version = 0;
    std::uint64_t sequence = 0;
};

using CachedResultPtr = std::shared_ptr<const CachedResult>;

struct ResultLookup {
    CachedResultPtr entry;
    bool hit = false;
};

/// Bounded cache of pipeline results.
///
/// An entry is served only while its table version matches the caller's.
/// Past `max_entries` the oldest insertions are evicted first.
class ResultCache {
   public:
    explicit ResultCache(std::size_t max_entries = 200);

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    /// Return the cached result for `key`, or run `compute` and store it.
    ///
    /// `compute` runs without the lock held; two concurrent misses on the
    /// same key both compute and the later store wins.
    [[nodiscard]] auto get_or_compute(const std::string& key, const std::string& table,
                                      std::uint64_t table_version,
                                      const std::function<PipelineResult()>& compute)
        -> ResultLookup;

    /// Remove entries of `table` computed against a version older than `version`.
    /// Returns the number of entries removed.
    auto drop_stale(const std::string& table, std::uint64_t version) -> std::size_t;

    void clear();

    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto max_entries() const noexcept -> std::size_t { return max_entries_; }

   private:
    void evict_locked();

    std::size_t max_entries_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CachedResultPtr> entries_;
    std::uint64_t next_sequence_ = 0;
};

}  // namespace tabula::runtime

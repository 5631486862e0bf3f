#include <tabula/runtime/result_cache.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace tabula::runtime {

auto make_result_key(const ResultKeyParts& parts) -> std::string {
    auto state_hash = fnv1a64(state::canonical_json(parts.state));
    return fmt::format("{}:{}:{}:{}:{}:{}:{}:{:016x}", parts.view_id, parts.table,
                       parts.table_version, parts.include_retired ? 1 : 0, parts.as_of.days,
                       parts.today.days, parts.cap, state_hash);
}

ResultCache::ResultCache(std::size_t max_entries)
    : max_entries_(std::max<std::size_t>(1, max_entries)) {}

auto ResultCache::get_or_compute(const std::string& key, const std::string& table,
                                 std::uint64_t table_version,
                                 const std::function<PipelineResult()>& compute) -> ResultLookup {
    {
        std::lock_guard lock(mutex_);
        if (auto it = entries_.find(key); it != entries_.end()) {
            if (it->second->table_version == table_version) {
                spdlog::debug("result cache: hit {}", key);
                return ResultLookup{.entry = it->second, .hit = true};
            }
            entries_.erase(it);
        }
    }

    spdlog::debug("result cache: miss {}", key);
    auto computed = std::make_shared<CachedResult>();
    computed->result = compute();
    computed->table = table;
    computed->table_version = table_version;

    std::lock_guard lock(mutex_);
    computed->sequence = next_sequence_++;
    CachedResultPtr entry = std::move(computed);
    entries_.insert_or_assign(key, entry);
    evict_locked();
    return ResultLookup{.entry = std::move(entry), .hit = false};
}

auto ResultCache::drop_stale(const std::string& table, std::uint64_t version) -> std::size_t {
    std::lock_guard lock(mutex_);
    auto removed = std::erase_if(entries_, [&](const auto& item) {
        return item.second->table == table && item.second->table_version < version;
    });
    if (removed > 0) {
        spdlog::debug("result cache: dropped {} stale entries of '{}' (< v{})", removed, table,
                      version);
    }
    return removed;
}

void ResultCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

auto ResultCache::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void ResultCache::evict_locked() {
    while (entries_.size() > max_entries_) {
        auto oldest = std::min_element(entries_.begin(), entries_.end(),
                                       [](const auto& lhs, const auto& rhs) {
                                           return lhs.second->sequence < rhs.second->sequence;
                                       });
        spdlog::debug("result cache: evicting {}", oldest->first);
        entries_.erase(oldest);
    }
}

}  // namespace tabula::runtime

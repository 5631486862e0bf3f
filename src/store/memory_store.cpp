#include <tabula/store/memory_store.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace tabula::store {

void InMemoryRecordStore::create_table(const std::string& table) {
    std::lock_guard lock(mutex_);
    tables_.try_emplace(table);
}

void InMemoryRecordStore::upsert(const std::string& table, Record record) {
    std::lock_guard lock(mutex_);
    auto& rows = tables_[table];
    auto id = record.id;
    rows.insert_or_assign(std::move(id), std::move(record));
}

auto InMemoryRecordStore::size(const std::string& table) const -> std::size_t {
    std::lock_guard lock(mutex_);
    if (auto it = tables_.find(table); it != tables_.end()) {
        return it->second.size();
    }
    return 0;
}

auto InMemoryRecordStore::collect(const std::string& table, const RecordWhere& where,
                                  RecordOrder order) const -> std::vector<const Record*> {
    std::vector<const Record*> out;
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return out;
    }
    out.reserve(it->second.size());
    for (const auto& [id, record] : it->second) {
        if (!where.include_retired && record.retired) {
            continue;
        }
        out.push_back(&record);
    }
    // Ties on modified-at fall back to id so that paging is deterministic.
    std::sort(out.begin(), out.end(), [order](const Record* lhs, const Record* rhs) {
        if (lhs->modified_at != rhs->modified_at) {
            return order == RecordOrder::ModifiedAsc ? lhs->modified_at < rhs->modified_at
                                                     : lhs->modified_at > rhs->modified_at;
        }
        return lhs->id < rhs->id;
    });
    return out;
}

auto InMemoryRecordStore::fetch_page(const std::string& table, const RecordWhere& where,
                                     RecordOrder order, std::size_t limit, std::size_t offset)
    -> Result<std::vector<Record>> {
    fetch_count_.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard lock(mutex_);
    if (!tables_.contains(table)) {
        return not_found(fmt::format("table not found: {}", table));
    }
    auto rows = collect(table, where, order);
    std::vector<Record> page;
    if (offset >= rows.size()) {
        return page;
    }
    auto end = std::min(rows.size(), offset + limit);
    page.reserve(end - offset);
    for (std::size_t i = offset; i < end; ++i) {
        page.push_back(*rows[i]);
    }
    return page;
}

auto InMemoryRecordStore::fetch_changed_since(const std::string& table, const RecordWhere& where,
                                              Timestamp since, RecordOrder order)
    -> Result<std::vector<Record>> {
    fetch_count_.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard lock(mutex_);
    if (!tables_.contains(table)) {
        return not_found(fmt::format("table not found: {}", table));
    }
    std::vector<Record> changed;
    for (const auto* record : collect(table, where, order)) {
        if (record->modified_at > since) {
            changed.push_back(*record);
        }
    }
    return changed;
}

void InMemoryViewStore::add(ViewDefinition view) {
    std::lock_guard lock(mutex_);
    auto id = view.id;
    views_.insert_or_assign(std::move(id), std::move(view));
}

auto InMemoryViewStore::load_view(const std::string& view_id) -> Result<ViewDefinition> {
    std::lock_guard lock(mutex_);
    if (auto it = views_.find(view_id); it != views_.end()) {
        return it->second;
    }
    return not_found(fmt::format("view not found: {}", view_id));
}

auto InMemoryStateStore::load_override(const std::string& state_key)
    -> Result<std::optional<StoredOverride>> {
    std::lock_guard lock(mutex_);
    if (auto it = entries_.find(state_key); it != entries_.end()) {
        return std::optional<StoredOverride>{it->second};
    }
    return std::optional<StoredOverride>{};
}

auto InMemoryStateStore::save_override(const std::string& state_key, const Json::Value& controls,
                                       const Json::Value& table_state) -> Result<void> {
    std::lock_guard lock(mutex_);
    entries_.insert_or_assign(state_key,
                              StoredOverride{.controls = controls, .table_state = table_state});
    return {};
}

void InMemoryLookupStore::add(const std::string& table, const std::string& key,
                              Json::Value dataset) {
    std::lock_guard lock(mutex_);
    datasets_.insert_or_assign({table, key}, std::move(dataset));
}

auto InMemoryLookupStore::load_dataset(const std::string& table, const std::string& key)
    -> Result<std::optional<Json::Value>> {
    load_count_.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard lock(mutex_);
    if (auto it = datasets_.find({table, key}); it != datasets_.end()) {
        return std::optional<Json::Value>{it->second};
    }
    return std::optional<Json::Value>{};
}

}  // namespace tabula::store

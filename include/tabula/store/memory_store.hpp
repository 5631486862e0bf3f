#pragma once

#include <tabula/store/lookup_store.hpp>
#include <tabula/store/record_store.hpp>
#include <tabula/store/view_store.hpp>

#include <atomic>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tabula::store {

/// Thread-safe in-memory record store, used by the CLI fixtures and tests.
class InMemoryRecordStore final : public RecordStore {
   public:
    InMemoryRecordStore() = default;

    /// Register `table` without rows. upsert() registers tables implicitly.
    void create_table(const std::string& table);

    /// Insert or replace a record by id.
    void upsert(const std::string& table, Record record);

    /// Number of rows stored for `table` (retired ones included).
    [[nodiscard]] auto size(const std::string& table) const -> std::size_t;

    /// Total number of fetch calls served so far.
    [[nodiscard]] auto fetch_count() const noexcept -> std::size_t {
        return fetch_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] auto fetch_page(const std::string& table, const RecordWhere& where,
                                  RecordOrder order, std::size_t limit, std::size_t offset)
        -> Result<std::vector<Record>> override;

    [[nodiscard]] auto fetch_changed_since(const std::string& table, const RecordWhere& where,
                                           Timestamp since, RecordOrder order)
        -> Result<std::vector<Record>> override;

   private:
    [[nodiscard]] auto collect(const std::string& table, const RecordWhere& where,
                               RecordOrder order) const -> std::vector<const Record*>;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::map<std::string, Record>> tables_;
    std::atomic<std::size_t> fetch_count_{0};
};

class InMemoryViewStore final : public ViewStore {
   public:
    InMemoryViewStore() = default;

    void add(ViewDefinition view);

    [[nodiscard]] auto load_view(const std::string& view_id) -> Result<ViewDefinition> override;

   private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ViewDefinition> views_;
};

class InMemoryStateStore final : public StateStore {
   public:
    InMemoryStateStore() = default;

    [[nodiscard]] auto load_override(const std::string& state_key)
        -> Result<std::optional<StoredOverride>> override;

    [[nodiscard]] auto save_override(const std::string& state_key, const Json::Value& controls,
                                     const Json::Value& table_state) -> Result<void> override;

   private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, StoredOverride> entries_;
};

class InMemoryLookupStore final : public LookupStore {
   public:
    InMemoryLookupStore() = default;

    void add(const std::string& table, const std::string& key, Json::Value dataset);

    /// Total number of load_dataset() calls served so far.
    [[nodiscard]] auto load_count() const noexcept -> std::size_t {
        return load_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] auto load_dataset(const std::string& table, const std::string& key)
        -> Result<std::optional<Json::Value>> override;

   private:
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, Json::Value> datasets_;
    std::atomic<std::size_t> load_count_{0};
};

}  // namespace tabula::store

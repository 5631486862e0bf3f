#pragma once

#include <tabula/runtime/dropdowns.hpp>
#include <tabula/runtime/result_cache.hpp>
#include <tabula/runtime/table_cache.hpp>
#include <tabula/store/lookup_store.hpp>
#include <tabula/store/record_store.hpp>

#include <cstddef>
#include <memory>
#include <utility>

namespace tabula::runtime {

/// Cache state owned by one session: the table cache, the result cache and,
/// when a lookup store is attached, the dropdown cache.
/// Passed explicitly to every request; nothing is stored in globals.
class SessionCacheStore {
   public:
    SessionCacheStore(store::RecordStore& records, TableCacheOptions table_options,
                      std::size_t result_max_entries, TableCache::Clock clock = {})
        : tables_(records, table_options, std::move(clock)), results_(result_max_entries) {}

    SessionCacheStore(store::RecordStore& records, store::LookupStore& lookups,
                      TableCacheOptions table_options, std::size_t result_max_entries,
                      TableCache::Clock clock = {})
        : tables_(records, table_options, std::move(clock)),
          results_(result_max_entries),
          dropdowns_(std::make_unique<DropdownCache>(lookups)) {}

    SessionCacheStore(const SessionCacheStore&) = delete;
    SessionCacheStore& operator=(const SessionCacheStore&) = delete;

    [[nodiscard]] auto tables() noexcept -> TableCache& { return tables_; }
    [[nodiscard]] auto results() noexcept -> ResultCache& { return results_; }
    /// Null when the session has no lookup store.
    [[nodiscard]] auto dropdowns() noexcept -> DropdownCache* { return dropdowns_.get(); }

   private:
    TableCache tables_;
    ResultCache results_;
    std::unique_ptr<DropdownCache> dropdowns_;
};

}  // namespace tabula::runtime

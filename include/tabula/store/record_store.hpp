#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/record.hpp>
#include <tabula/core/time.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tabula::store {

enum class RecordOrder : std::uint8_t {
    ModifiedAsc,
    ModifiedDesc,
};

/// Row predicate pushed down to the store.
struct RecordWhere {
    /// When false, records flagged as retired are not returned.
    bool include_retired = true;
};

/// Source of table rows.
///
/// Implementations must report each record's last-modified timestamp and
/// retirement date. Calls may block; they are the only suspension points of a
/// matrix request.
class RecordStore {
   public:
    RecordStore() = default;
    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;
    virtual ~RecordStore() = default;

    /// One page of `table`, `limit` rows starting at `offset` in `order`.
    [[nodiscard]] virtual auto fetch_page(const std::string& table, const RecordWhere& where,
                                          RecordOrder order, std::size_t limit, std::size_t offset)
        -> Result<std::vector<Record>> = 0;

    /// All rows of `table` whose modified-at is strictly greater than `since`.
    [[nodiscard]] virtual auto fetch_changed_since(const std::string& table,
                                                   const RecordWhere& where, Timestamp since,
                                                   RecordOrder order)
        -> Result<std::vector<Record>> = 0;
};

}  // namespace tabula::store

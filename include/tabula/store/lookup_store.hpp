#pragma once

#include <tabula/core/error.hpp>

#include <json/json.h>

#include <optional>
#include <string>

namespace tabula::store {

/// Source of lookup datasets (dropdown option lists), one JSON document per
/// (table, key).
class LookupStore {
   public:
    LookupStore() = default;
    LookupStore(const LookupStore&) = delete;
    LookupStore& operator=(const LookupStore&) = delete;
    virtual ~LookupStore() = default;

    /// The dataset body, or an empty optional when `key` is not in `table`.
    [[nodiscard]] virtual auto load_dataset(const std::string& table, const std::string& key)
        -> Result<std::optional<Json::Value>> = 0;
};

}  // namespace tabula::store

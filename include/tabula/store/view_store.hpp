#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/view.hpp>

#include <json/json.h>

#include <optional>
#include <string>

namespace tabula::store {

/// Read-only source of view definitions.
class ViewStore {
   public:
    ViewStore() = default;
    ViewStore(const ViewStore&) = delete;
    ViewStore& operator=(const ViewStore&) = delete;
    virtual ~ViewStore() = default;

    /// Fails with ErrorKind::NotFound when `view_id` is unknown.
    [[nodiscard]] virtual auto load_view(const std::string& view_id) -> Result<ViewDefinition> = 0;
};

/// Persisted per-user state for one view instance, kept in its raw form.
/// It is sanitized on every read, so it may hold anything a client sent.
struct StoredOverride {
    Json::Value controls{Json::objectValue};
    Json::Value table_state{Json::objectValue};
};

/// Persistence of user overrides keyed by view-instance state key.
class StateStore {
   public:
    StateStore() = default;
    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;
    virtual ~StateStore() = default;

    /// Empty optional when nothing has been saved under `state_key` yet.
    [[nodiscard]] virtual auto load_override(const std::string& state_key)
        -> Result<std::optional<StoredOverride>> = 0;

    [[nodiscard]] virtual auto save_override(const std::string& state_key,
                                             const Json::Value& controls,
                                             const Json::Value& table_state) -> Result<void> = 0;
};

}  // namespace tabula::store

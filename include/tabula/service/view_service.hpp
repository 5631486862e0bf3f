#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/time.hpp>
#include <tabula/core/view.hpp>
#include <tabula/runtime/matrix.hpp>
#include <tabula/runtime/session.hpp>
#include <tabula/state/controls.hpp>
#include <tabula/state/table_state.hpp>
#include <tabula/store/view_store.hpp>

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tabula::service {

/// Which view instance a call addresses.
struct ViewScope {
    std::string view_id;
    /// Table override; the view's root table when empty.
    std::optional<std::string> table;
    /// Distinguishes several uses of one view over the same table.
    std::optional<std::string> edit_type;
};

/// Persistence key of a view instance: `view_id[:table][:edit_type]`.
[[nodiscard]] auto state_key(const ViewScope& scope) -> std::string;

struct ViewStateResponse {
    std::string view_id;
    state::ControlOverrides controls_source;
    std::vector<state::EffectiveControl> controls_effective;
    /// Normalized table state; persisted as-is, so source and effective agree.
    state::TableState table_state;
    state::ControlsMeta controls_meta;
    state::TableStateMeta table_state_meta;
    std::vector<std::string> warnings;
};

/// Body of put_state(). Null members keep what is stored.
struct StateUpdate {
    Json::Value controls_source{Json::nullValue};
    Json::Value table_state_source{Json::nullValue};
};

/// Body of post_matrix(). Absent sources fall back to the persisted ones.
struct MatrixQuery {
    std::optional<Json::Value> controls_source;
    std::optional<Json::Value> table_state_source;
    bool include_retired = true;
    std::optional<std::int64_t> limit;
    std::int64_t offset = 0;
    std::optional<Date> as_of;
    std::optional<std::int64_t> max_base_rows;
    /// Language of dropdown labels.
    std::optional<std::string> language;
};

/// `{controlsSource?, tableStateSource?}`; InvalidInput when either is
/// present but not an object or null.
[[nodiscard]] auto decode_state_update(const Json::Value& body) -> Result<StateUpdate>;

/// `{controlsSource?, tableStateSource?, includeRetired?, limit?, offset?,
/// asOf?, maxBaseRows?, language?}`; InvalidInput on members of the wrong type.
[[nodiscard]] auto decode_matrix_query(const Json::Value& body) -> Result<MatrixQuery>;

/// `{viewId, controlsSource, controlsEffective[], tableStateSource,
/// tableStateEffective, meta}`.
[[nodiscard]] auto to_json(const ViewStateResponse& response) -> Json::Value;

/// The exposed view API.
///
/// Holds references only; the stores and the session cache must outlive it.
class ViewService {
   public:
    ViewService(store::ViewStore& views, store::StateStore& states,
                runtime::SessionCacheStore& session, runtime::MatrixOptions options);

    [[nodiscard]] auto get_definition(const std::string& view_id) -> Result<ViewDefinition>;

    /// Effective controls and table state of a view instance.
    [[nodiscard]] auto get_state(const ViewScope& scope) -> Result<ViewStateResponse>;

    /// Sanitize, persist and return the new state. Parts absent from `update`
    /// keep their stored value.
    [[nodiscard]] auto put_state(const ViewScope& scope, const StateUpdate& update)
        -> Result<ViewStateResponse>;

    /// One page of the view. Nothing is persisted.
    [[nodiscard]] auto post_matrix(const ViewScope& scope, const MatrixQuery& query)
        -> Result<runtime::MatrixResponse>;

   private:
    [[nodiscard]] auto load_stored(const std::string& key) -> Result<store::StoredOverride>;

    [[nodiscard]] auto resolve_state(const ViewDefinition& view, const Json::Value& controls,
                                     const Json::Value& table_state) const -> ViewStateResponse;

    store::ViewStore& views_;
    store::StateStore& states_;
    runtime::SessionCacheStore& session_;
    runtime::MatrixOptions options_;
};

}  // namespace tabula::service

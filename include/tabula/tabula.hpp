#pragma once

/// Convenience umbrella header for the Tabula library.

#include <tabula/config/engine_config.hpp>
#include <tabula/core/error.hpp>
#include <tabula/core/record.hpp>
#include <tabula/core/time.hpp>
#include <tabula/core/value.hpp>
#include <tabula/core/view.hpp>
#include <tabula/runtime/dropdowns.hpp>
#include <tabula/runtime/matrix.hpp>
#include <tabula/runtime/pipeline.hpp>
#include <tabula/runtime/projector.hpp>
#include <tabula/runtime/result_cache.hpp>
#include <tabula/runtime/session.hpp>
#include <tabula/runtime/table_cache.hpp>
#include <tabula/service/view_service.hpp>
#include <tabula/state/controls.hpp>
#include <tabula/state/table_state.hpp>
#include <tabula/store/json_codec.hpp>
#include <tabula/store/lookup_store.hpp>
#include <tabula/store/memory_store.hpp>
#include <tabula/store/record_store.hpp>
#include <tabula/store/view_store.hpp>

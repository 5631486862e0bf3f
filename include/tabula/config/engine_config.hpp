#pragma once

#include <tabula/core/error.hpp>
#include <tabula/runtime/matrix.hpp>
#include <tabula/runtime/table_cache.hpp>

#include <json/json.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace tabula::config {

/// Engine tunables. Defaults are the production values.
struct EngineConfig {
    /// Upper bound on rows kept per table by a full load.
    std::size_t table_cache_max_rows = 20'000;
    std::size_t table_cache_chunk_size = 2'000;
    std::chrono::milliseconds table_cache_refresh_interval{2'000};
    std::size_t result_cache_max_entries = 200;
    std::size_t default_page_limit = 200;
    std::size_t max_page_limit = 10'000;

    [[nodiscard]] auto table_cache_options() const -> runtime::TableCacheOptions {
        return runtime::TableCacheOptions{.max_rows = table_cache_max_rows,
                                          .chunk_size = table_cache_chunk_size,
                                          .refresh_interval = table_cache_refresh_interval};
    }

    [[nodiscard]] auto matrix_options() const -> runtime::MatrixOptions {
        runtime::MatrixOptions options;
        options.default_page_limit = default_page_limit;
        options.max_page_limit = max_page_limit;
        options.max_base_rows = table_cache_max_rows;
        return options;
    }
};

/// InvalidInput unless every limit is positive and the default page limit
/// does not exceed the maximum.
[[nodiscard]] auto validate(const EngineConfig& config) -> Result<void>;

/// Read a config object. Keys:
///   table_cache_max_rows, table_cache_chunk_size, table_cache_refresh_ms,
///   result_cache_max_entries, default_page_limit, max_page_limit
/// Missing keys keep their defaults; unknown keys are logged and ignored.
[[nodiscard]] auto config_from_json(const Json::Value& json) -> Result<EngineConfig>;

[[nodiscard]] auto load_config(const std::filesystem::path& path) -> Result<EngineConfig>;

/// Environment lookup; returns nullopt for unset variables.
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

/// std::getenv-backed lookup.
[[nodiscard]] auto process_env() -> EnvLookup;

/// Apply TABULA_TABLE_CACHE_MAX_ROWS, TABULA_TABLE_CACHE_CHUNK_SIZE,
/// TABULA_TABLE_CACHE_REFRESH_MS and TABULA_RESULT_CACHE_MAX_ENTRIES.
[[nodiscard]] auto apply_env_overrides(EngineConfig& config, const EnvLookup& env = process_env())
    -> Result<void>;

}  // namespace tabula::config

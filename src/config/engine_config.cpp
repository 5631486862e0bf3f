#include <tabula/config/engine_config.hpp>
#include <tabula/store/json_codec.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace tabula::config {

namespace {

constexpr std::string_view kKnownKeys[] = {
    "table_cache_max_rows",     "table_cache_chunk_size", "table_cache_refresh_ms",
    "result_cache_max_entries", "default_page_limit",     "max_page_limit",
};

auto parse_positive(std::string_view text, std::string_view what) -> Result<std::size_t> {
    std::size_t out = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc() || ptr != text.data() + text.size() || out == 0) {
        return invalid_input(fmt::format("{}: expected a positive integer, got '{}'", what, text));
    }
    return out;
}

auto json_positive(const Json::Value& json, const char* key, std::size_t& target) -> Result<void> {
    if (!json.isMember(key)) {
        return {};
    }
    const auto& value = json[key];
    if (!value.isIntegral() || !value.isUInt64() || value.asUInt64() == 0) {
        return invalid_input(fmt::format("{}: expected a positive integer", key));
    }
    target = static_cast<std::size_t>(value.asUInt64());
    return {};
}

auto env_positive(const EnvLookup& env, const char* name, std::size_t& target) -> Result<void> {
    auto raw = env(name);
    if (!raw) {
        return {};
    }
    auto value = parse_positive(*raw, name);
    if (!value) {
        return std::unexpected(value.error());
    }
    target = *value;
    return {};
}

}  // namespace

auto validate(const EngineConfig& config) -> Result<void> {
    if (config.table_cache_max_rows == 0 || config.table_cache_chunk_size == 0 ||
        config.result_cache_max_entries == 0 || config.default_page_limit == 0 ||
        config.max_page_limit == 0) {
        return invalid_input("config: limits must be positive");
    }
    if (config.table_cache_refresh_interval.count() < 0) {
        return invalid_input("config: refresh interval must not be negative");
    }
    if (config.default_page_limit > config.max_page_limit) {
        return invalid_input(fmt::format("config: default_page_limit {} exceeds max_page_limit {}",
                                         config.default_page_limit, config.max_page_limit));
    }
    return {};
}

auto config_from_json(const Json::Value& json) -> Result<EngineConfig> {
    if (!json.isObject()) {
        return invalid_input("config: expected an object");
    }
    for (const auto& key : json.getMemberNames()) {
        bool known = false;
        for (auto name : kKnownKeys) {
            known = known || key == name;
        }
        if (!known) {
            spdlog::warn("config: ignoring unknown key '{}'", key);
        }
    }

    EngineConfig config;
    for (auto step : {json_positive(json, "table_cache_max_rows", config.table_cache_max_rows),
                      json_positive(json, "table_cache_chunk_size", config.table_cache_chunk_size),
                      json_positive(json, "result_cache_max_entries",
                                    config.result_cache_max_entries),
                      json_positive(json, "default_page_limit", config.default_page_limit),
                      json_positive(json, "max_page_limit", config.max_page_limit)}) {
        if (!step) {
            return std::unexpected(step.error());
        }
    }
    if (json.isMember("table_cache_refresh_ms")) {
        const auto& value = json["table_cache_refresh_ms"];
        if (!value.isIntegral() || !value.isInt64() || value.asInt64() < 0) {
            return invalid_input("table_cache_refresh_ms: expected a non-negative integer");
        }
        config.table_cache_refresh_interval = std::chrono::milliseconds{value.asInt64()};
    }

    if (auto valid = validate(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

auto load_config(const std::filesystem::path& path) -> Result<EngineConfig> {
    auto json = store::read_json_file(path);
    if (!json) {
        return std::unexpected(json.error());
    }
    auto config = config_from_json(*json);
    if (config) {
        spdlog::debug("config: loaded {}", path.string());
    }
    return config;
}

auto process_env() -> EnvLookup {
    return [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

auto apply_env_overrides(EngineConfig& config, const EnvLookup& env) -> Result<void> {
    EngineConfig updated = config;
    for (auto step :
         {env_positive(env, "TABULA_TABLE_CACHE_MAX_ROWS", updated.table_cache_max_rows),
          env_positive(env, "TABULA_TABLE_CACHE_CHUNK_SIZE", updated.table_cache_chunk_size),
          env_positive(env, "TABULA_RESULT_CACHE_MAX_ENTRIES",
                       updated.result_cache_max_entries)}) {
        if (!step) {
            return std::unexpected(step.error());
        }
    }
    if (auto raw = env("TABULA_TABLE_CACHE_REFRESH_MS")) {
        std::int64_t millis = 0;
        auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), millis);
        if (ec != std::errc() || ptr != raw->data() + raw->size() || millis < 0) {
            return invalid_input(fmt::format(
                "TABULA_TABLE_CACHE_REFRESH_MS: expected a non-negative integer, got '{}'", *raw));
        }
        updated.table_cache_refresh_interval = std::chrono::milliseconds{millis};
    }
    if (auto valid = validate(updated); !valid) {
        return std::unexpected(valid.error());
    }
    config = updated;
    return {};
}

}  // namespace tabula::config

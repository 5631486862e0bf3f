#include <tabula/config/engine_config.hpp>
#include <tabula/runtime/matrix.hpp>
#include <tabula/runtime/session.hpp>
#include <tabula/service/view_service.hpp>
#include <tabula/store/json_codec.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>

namespace {

auto fail(const tabula::Error& error) -> int {
    fmt::print(stderr, "error: {}\n", error.format());
    return 1;
}

auto non_empty(const std::string& value) -> std::optional<std::string> {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"Tabula: view matrix engine"};
    app.require_subcommand(1);

    bool verbose = false;
    std::string fixture_path;
    std::string config_path;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_option("-f,--fixture", fixture_path,
                   "JSON document with views, tables and stored state")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-c,--config", config_path,
                   "Engine config (JSON). TABULA_* environment variables override it.");

    std::string view_id;
    std::string table;
    std::string edit_type;
    bool json_output = false;

    auto* definition = app.add_subcommand("definition", "Print a view definition");
    definition->add_option("view", view_id, "View id")->required();

    auto* state = app.add_subcommand("state", "Print the effective state of a view instance");
    state->add_option("view", view_id, "View id")->required();
    state->add_option("--table", table, "Table override");
    state->add_option("--edit-type", edit_type, "Edit type of the view instance");

    std::int64_t limit = 0;
    std::int64_t offset = 0;
    std::int64_t max_base_rows = 0;
    bool exclude_retired = false;
    std::string as_of;
    std::string language;
    std::string request_path;
    auto* matrix = app.add_subcommand("matrix", "Build one page of a view");
    matrix->add_option("view", view_id, "View id")->required();
    matrix->add_option("--table", table, "Table override");
    matrix->add_option("--edit-type", edit_type, "Edit type of the view instance");
    auto* limit_opt = matrix->add_option("--limit", limit, "Page size (default from config)");
    auto* offset_opt = matrix->add_option("--offset", offset, "First row of the page");
    auto* max_base_rows_opt =
        matrix->add_option("--max-base-rows", max_base_rows, "Cap on rows loaded from the table");
    matrix->add_flag("--exclude-retired", exclude_retired, "Leave out retired records");
    matrix->add_option("--as-of", as_of, "Projection date (YYYY-MM-DD), default today");
    matrix->add_option("--language", language, "Language of dropdown labels (e.g. DE-DE)");
    matrix->add_option("--request", request_path,
                       "JSON request body with controlsSource/tableStateSource")
        ->check(CLI::ExistingFile);
    matrix->add_flag("--json", json_output, "Print the JSON response instead of a table");

    CLI11_PARSE(app, argc, argv);

    // stdout carries the JSON and table output.
    spdlog::set_default_logger(spdlog::stderr_color_mt("tabula"));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    tabula::config::EngineConfig config;
    if (!config_path.empty()) {
        auto loaded = tabula::config::load_config(config_path);
        if (!loaded) {
            return fail(loaded.error());
        }
        config = *loaded;
    }
    if (auto env = tabula::config::apply_env_overrides(config); !env) {
        return fail(env.error());
    }

    auto fixture = tabula::store::load_fixture_file(fixture_path);
    if (!fixture) {
        return fail(fixture.error());
    }
    spdlog::info("Tabula started (fixture={}, verbose={})", fixture_path, verbose);

    tabula::runtime::SessionCacheStore session(*fixture->records, *fixture->lookups,
                                               config.table_cache_options(),
                                               config.result_cache_max_entries);
    tabula::service::ViewService service(*fixture->views, *fixture->state, session,
                                         config.matrix_options());
    const tabula::service::ViewScope scope{
        .view_id = view_id, .table = non_empty(table), .edit_type = non_empty(edit_type)};

    if (*definition) {
        auto view = service.get_definition(view_id);
        if (!view) {
            return fail(view.error());
        }
        std::cout << tabula::store::write_pretty(tabula::store::encode_definition(*view)) << "\n";
        return 0;
    }

    if (*state) {
        auto response = service.get_state(scope);
        if (!response) {
            return fail(response.error());
        }
        std::cout << tabula::store::write_pretty(tabula::service::to_json(*response)) << "\n";
        return 0;
    }

    Json::Value body(Json::objectValue);
    if (!request_path.empty()) {
        auto loaded = tabula::store::read_json_file(request_path);
        if (!loaded) {
            return fail(loaded.error());
        }
        body = *loaded;
    }
    auto query = tabula::service::decode_matrix_query(body);
    if (!query) {
        return fail(query.error());
    }
    if (limit_opt->count() > 0) {
        query->limit = limit;
    }
    if (offset_opt->count() > 0) {
        query->offset = offset;
    }
    if (max_base_rows_opt->count() > 0) {
        query->max_base_rows = max_base_rows;
    }
    if (exclude_retired) {
        query->include_retired = false;
    }
    if (!language.empty()) {
        query->language = language;
    }
    if (!as_of.empty()) {
        auto date = tabula::parse_date(as_of);
        if (!date) {
            return fail(tabula::Error{.kind = tabula::ErrorKind::InvalidInput,
                                      .message = fmt::format("invalid --as-of '{}'", as_of)});
        }
        query->as_of = *date;
    }

    auto response = service.post_matrix(scope, *query);
    if (!response) {
        return fail(response.error());
    }
    if (json_output) {
        std::cout << tabula::store::write_pretty(tabula::store::encode_matrix(*response)) << "\n";
    } else {
        tabula::runtime::print_matrix(*response, std::cout);
    }
    return 0;
}

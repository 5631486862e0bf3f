#include <tabula/tabula.hpp>

#include <fmt/core.h>

#include <iostream>

namespace {

auto control(std::string id, std::string field, tabula::ControlType type, std::int64_t order)
    -> tabula::Control {
    tabula::Control c;
    c.id = id;
    c.label = std::move(id);
    c.source = tabula::FieldKey{.group = "DATA", .field = std::move(field)};
    c.type = type;
    c.display_order = order;
    return c;
}

auto trade(std::string id, const std::string& symbol, double price, const std::string& desk,
           tabula::Date day) -> tabula::Record {
    tabula::Record record;
    record.id = std::move(id);
    record.name = symbol;
    record.created_at = tabula::start_of_day(day);
    record.modified_at = record.created_at;
    record.set("DATA", "SYMBOL", tabula::FieldValue::scalar(symbol));
    record.set("DATA", "DESK", tabula::FieldValue::scalar(desk));
    // Price history: the opening price, revised a month later.
    record.set("DATA", "PRICE",
               tabula::FieldValue::temporal(tabula::TemporalMap{
                   {tabula::start_of_day(day), tabula::Value{price}},
                   {tabula::start_of_day(tabula::Date{day.days + 30}), tabula::Value{price * 1.1}},
               }));
    return record;
}

}  // namespace

auto main() -> int {
    tabula::store::InMemoryViewStore views;
    tabula::store::InMemoryRecordStore records;

    tabula::ViewDefinition view;
    view.id = "trades";
    view.name = "Trades";
    view.root_table = "trades";
    view.controls = {control("symbol", "SYMBOL", tabula::ControlType::String, 1),
                     control("price", "PRICE", tabula::ControlType::Number, 2),
                     control("desk", "DESK", tabula::ControlType::Dropdown, 3)};
    views.add(view);

    auto day = tabula::make_date(2025, 1, 6);
    records.upsert("trades", trade("t1", "AAPL", 190.5, "equities", day));
    records.upsert("trades", trade("t2", "MSFT", 410.0, "equities", day));
    records.upsert("trades", trade("t3", "BUND", 131.2, "rates", day));
    records.upsert("trades", trade("t4", "UST10", 98.7, "rates", day));

    tabula::runtime::SessionCacheStore session(records, tabula::runtime::TableCacheOptions{}, 16);
    tabula::runtime::MatrixOptions options;

    fmt::print("=== Sorted by price, as of opening ===\n");
    tabula::runtime::MatrixRequest request;
    request.view_id = "trades";
    request.as_of = day;
    request.table_state_source["sort"]["controlId"] = "price";
    request.table_state_source["sort"]["direction"] = "desc";
    auto page = tabula::runtime::build_matrix(views, session, options, request);
    if (!page) {
        fmt::print("error: {}\n", page.error().format());
        return 1;
    }
    tabula::runtime::print_matrix(*page, std::cout);

    fmt::print("\n=== Grouped by desk, two rows per page, after the revision ===\n");
    request.as_of = tabula::Date{day.days + 31};
    request.limit = 2;
    request.table_state_source["group"]["enabled"] = true;
    request.table_state_source["group"]["by"] = "desk";
    request.table_state_source["group"]["sumBy"] = "price";
    for (std::int64_t offset = 0;; offset += request.limit) {
        request.offset = offset;
        auto grouped = tabula::runtime::build_matrix(views, session, options, request);
        if (!grouped) {
            fmt::print("error: {}\n", grouped.error().format());
            return 1;
        }
        tabula::runtime::print_matrix(*grouped, std::cout);
        if (!grouped->meta.has_more) {
            break;
        }
    }

    fmt::print("\n=== Last page as JSON ===\n");
    request.offset = 2;
    auto last = tabula::runtime::build_matrix(views, session, options, request);
    if (!last) {
        fmt::print("error: {}\n", last.error().format());
        return 1;
    }
    fmt::print("{}\n", tabula::store::write_pretty(tabula::store::encode_matrix(*last)));
    return 0;
}

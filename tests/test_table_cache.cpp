#include <tabula/runtime/table_cache.hpp>

#include <catch2/catch_test_macros.hpp>
#include <fmt/format.h>

#include <atomic>
#include <thread>
#include <vector>

#include "test_support.hpp"

namespace {

using namespace tabula;
using namespace std::chrono_literals;
using runtime::TableCache;
using runtime::TableCacheOptions;

auto seeded_store(std::size_t rows) -> std::unique_ptr<store::InMemoryRecordStore> {
    auto records = std::make_unique<store::InMemoryRecordStore>();
    records->create_table("items");
    for (std::size_t i = 1; i <= rows; ++i) {
        records->upsert("items", test::named_record(fmt::format("r{}", i), fmt::format("row {}", i),
                                                    test::day(2025, 1, static_cast<unsigned>(i))));
    }
    return records;
}

auto manual(test::ManualClock& clock) -> TableCache::Clock {
    return [&clock] { return clock.now(); };
}

auto ids(const runtime::TableSnapshot& snapshot) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& row : snapshot.rows) {
        out.push_back(row.id);
    }
    return out;
}

}  // namespace

TEST_CASE("Cold start loads the table newest first") {
    auto records = seeded_store(3);
    test::ManualClock clock;
    TableCache cache(*records, TableCacheOptions{}, manual(clock));

    auto handle = cache.ensure("items", true, 100);
    REQUIRE(handle.has_value());
    REQUIRE(handle->version() == 1);
    REQUIRE(handle->previous_version == 0);
    REQUIRE(handle->version_changed());
    REQUIRE(ids(*handle->snapshot) == std::vector<std::string>{"r3", "r2", "r1"});
    REQUIRE(handle->snapshot->watermark == test::day(2025, 1, 3));
    REQUIRE_FALSE(handle->snapshot->truncated);
    REQUIRE(handle->snapshot->find("r2") != nullptr);
    REQUIRE(handle->snapshot->find("missing") == nullptr);
    REQUIRE(cache.peek("items", true) == handle->snapshot);
    REQUIRE(cache.peek("items", false) == nullptr);
}

TEST_CASE("Empty table starts at version zero") {
    store::InMemoryRecordStore records;
    records.create_table("empty");
    TableCache cache(records, TableCacheOptions{});

    auto handle = cache.ensure("empty", true, 10);
    REQUIRE(handle.has_value());
    REQUIRE(handle->snapshot->rows.empty());
    REQUIRE(handle->version() == 0);
    REQUIRE_FALSE(handle->version_changed());
}

TEST_CASE("Full load pages by chunk size") {
    auto records = seeded_store(5);
    TableCacheOptions options;
    options.chunk_size = 2;
    TableCache cache(*records, options);

    auto handle = cache.ensure("items", true, 10);
    REQUIRE(handle.has_value());
    REQUIRE(handle->snapshot->rows.size() == 5);
    // 2 + 2 + 1: the short page ends the load.
    REQUIRE(records->fetch_count() == 3);
}

TEST_CASE("Refreshes are throttled to the refresh interval") {
    auto records = seeded_store(1);
    test::ManualClock clock;
    TableCacheOptions options;
    options.refresh_interval = 2'000ms;
    TableCache cache(*records, options, manual(clock));

    REQUIRE(cache.ensure("items", true, 100).has_value());
    const auto fetches = records->fetch_count();

    records->upsert("items", test::named_record("r2", "row 2", test::day(2025, 2, 1)));
    clock.advance(500ms);
    auto served = cache.ensure("items", true, 100);
    REQUIRE(served.has_value());
    REQUIRE(records->fetch_count() == fetches);
    REQUIRE(served->snapshot->rows.size() == 1);
    REQUIRE_FALSE(served->version_changed());

    clock.advance(1'500ms);
    auto refreshed = cache.ensure("items", true, 100);
    REQUIRE(refreshed.has_value());
    REQUIRE(records->fetch_count() == fetches + 1);
    REQUIRE(refreshed->snapshot->rows.size() == 2);
    REQUIRE(refreshed->version() == 2);
    REQUIRE(refreshed->previous_version == 1);
    REQUIRE(refreshed->snapshot->rows.front().id == "r2");
    REQUIRE(refreshed->snapshot->watermark == test::day(2025, 2, 1));
}

TEST_CASE("Delta without changes keeps the version") {
    auto records = seeded_store(2);
    test::ManualClock clock;
    TableCache cache(*records, TableCacheOptions{}, manual(clock));

    auto first = cache.ensure("items", true, 100);
    clock.advance(5s);
    auto second = cache.ensure("items", true, 100);
    REQUIRE(second.has_value());
    REQUIRE(second->version() == first->version());
    REQUIRE_FALSE(second->version_changed());
    REQUIRE(second->snapshot == first->snapshot);
}

TEST_CASE("Delta replaces changed records") {
    auto records = seeded_store(2);
    test::ManualClock clock;
    TableCache cache(*records, TableCacheOptions{}, manual(clock));
    REQUIRE(cache.ensure("items", true, 100).has_value());

    records->upsert("items", test::named_record("r1", "renamed", test::day(2025, 3, 1)));
    clock.advance(5s);
    auto handle = cache.ensure("items", true, 100);
    REQUIRE(handle.has_value());
    REQUIRE(handle->snapshot->rows.size() == 2);
    REQUIRE(handle->snapshot->rows.front().id == "r1");
    REQUIRE(handle->snapshot->find("r1")->name == "renamed");
    REQUIRE(handle->version() == 2);
}

TEST_CASE("Delta drops records that became retired when retired rows are excluded") {
    auto records = seeded_store(2);
    test::ManualClock clock;
    TableCache cache(*records, TableCacheOptions{}, manual(clock));
    REQUIRE(cache.ensure("items", false, 100)->snapshot->rows.size() == 2);

    auto retired = test::named_record("r1", "row 1", test::day(2025, 3, 1));
    retired.retired = true;
    records->upsert("items", retired);
    clock.advance(5s);

    auto handle = cache.ensure("items", false, 100);
    REQUIRE(handle.has_value());
    REQUIRE(ids(*handle->snapshot) == std::vector<std::string>{"r2"});
    REQUIRE(handle->version_changed());

    // The include-retired entry is separate and keeps the row.
    auto with_retired = cache.ensure("items", true, 100);
    REQUIRE(with_retired->snapshot->rows.size() == 2);
}

TEST_CASE("Truncated snapshot is reloaded for a larger cap") {
    auto records = seeded_store(5);
    test::ManualClock clock;
    TableCache cache(*records, TableCacheOptions{}, manual(clock));

    auto small = cache.ensure("items", true, 3);
    REQUIRE(small.has_value());
    REQUIRE(small->snapshot->truncated);
    REQUIRE(small->snapshot->cap == 3);
    REQUIRE(ids(*small->snapshot) == std::vector<std::string>{"r5", "r4", "r3"});

    // No clock advance: the larger cap alone forces the reload.
    auto large = cache.ensure("items", true, 10);
    REQUIRE(large.has_value());
    REQUIRE_FALSE(large->snapshot->truncated);
    REQUIRE(large->snapshot->rows.size() == 5);
    REQUIRE(large->version() == small->version() + 1);
}

TEST_CASE("Larger cap reloads a complete snapshot without a version bump") {
    auto records = seeded_store(3);
    test::ManualClock clock;
    TableCache cache(*records, TableCacheOptions{}, manual(clock));

    auto first = cache.ensure("items", true, 10);
    REQUIRE(first.has_value());
    REQUIRE_FALSE(first->snapshot->truncated);
    const auto fetches = records->fetch_count();

    auto larger = cache.ensure("items", true, 50);
    REQUIRE(larger.has_value());
    REQUIRE(records->fetch_count() > fetches);
    REQUIRE(larger->snapshot->cap == 50);
    REQUIRE(larger->snapshot->rows.size() == 3);
    REQUIRE(larger->version() == first->version());

    // Same or smaller caps are served from the loaded snapshot.
    const auto after_reload = records->fetch_count();
    REQUIRE(cache.ensure("items", true, 20).has_value());
    REQUIRE(cache.ensure("items", true, 50).has_value());
    REQUIRE(records->fetch_count() == after_reload);
}

TEST_CASE("Requested caps are clamped to the configured maximum") {
    store::InMemoryRecordStore records;
    TableCacheOptions options;
    options.max_rows = 100;
    TableCache cache(records, options);

    REQUIRE(cache.effective_cap(0) == 1);
    REQUIRE(cache.effective_cap(50) == 50);
    REQUIRE(cache.effective_cap(5'000) == 100);
}

TEST_CASE("Cold start failures surface as errors") {
    auto records = seeded_store(1);
    test::FlakyStore flaky(*records);
    TableCache cache(flaky, TableCacheOptions{});

    auto unknown = cache.ensure("nope", true, 10);
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().kind == ErrorKind::NotFound);

    flaky.set_failing(true);
    auto down = cache.ensure("items", true, 10);
    REQUIRE_FALSE(down.has_value());
    REQUIRE(down.error().kind == ErrorKind::UpstreamUnavailable);
}

TEST_CASE("Refresh failures serve the cached snapshot with a warning") {
    auto records = seeded_store(4);
    test::FlakyStore flaky(*records);
    test::ManualClock clock;
    TableCache cache(flaky, TableCacheOptions{}, manual(clock));

    auto first = cache.ensure("items", true, 2);
    REQUIRE(first.has_value());
    flaky.set_failing(true);

    SECTION("delta") {
        clock.advance(5s);
        auto handle = cache.ensure("items", true, 2);
        REQUIRE(handle.has_value());
        REQUIRE(handle->snapshot == first->snapshot);
        REQUIRE(handle->warnings.size() == 1);
    }

    SECTION("reload for a larger cap") {
        auto handle = cache.ensure("items", true, 10);
        REQUIRE(handle.has_value());
        REQUIRE(handle->snapshot == first->snapshot);
        REQUIRE(handle->warnings.size() == 1);
    }
}

TEST_CASE("Versions seen by concurrent readers never decrease", "[concurrency]") {
    auto records = seeded_store(1);
    TableCacheOptions options;
    options.refresh_interval = 0ms;
    TableCache cache(*records, options);
    REQUIRE(cache.ensure("items", true, 1'000).has_value());

    constexpr int kWrites = 200;
    std::atomic<bool> regressed{false};
    std::atomic<bool> failed{false};

    std::thread writer([&] {
        for (int i = 0; i < kWrites; ++i) {
            auto record =
                test::named_record(fmt::format("w{}", i), "written", test::day(2025, 6, 1));
            record.modified_at.micros += i + 1;
            records->upsert("items", record);
        }
    });

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&] {
            std::uint64_t last = 0;
            for (int i = 0; i < 100; ++i) {
                auto handle = cache.ensure("items", true, 1'000);
                if (!handle) {
                    failed = true;
                    return;
                }
                if (handle->version() < last) {
                    regressed = true;
                }
                last = handle->version();
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }
    REQUIRE_FALSE(failed.load());
    REQUIRE_FALSE(regressed.load());

    auto last = cache.ensure("items", true, 1'000);
    REQUIRE(last.has_value());
    REQUIRE(last->snapshot->rows.size() == kWrites + 1);
}

TEST_CASE("Version counts exactly the refreshes that changed a record") {
    auto records = seeded_store(2);
    test::ManualClock clock;
    TableCache cache(*records, TableCacheOptions{}, manual(clock));
    REQUIRE(cache.ensure("items", true, 100)->version() == 1);

    std::int64_t stamp = 0;
    auto write = [&](const std::string& id) {
        auto record = test::named_record(id, "written", test::day(2025, 2, 1));
        record.modified_at.micros += ++stamp;
        records->upsert("items", record);
    };

    std::uint64_t refreshes_with_changes = 0;
    for (int round = 0; round < 9; ++round) {
        // 0, 1 or 2 writes land before each refresh.
        const int writes = round % 3;
        for (int w = 0; w < writes; ++w) {
            write(w == 0 ? "r1" : fmt::format("n{}", round));
        }
        clock.advance(5s);
        auto handle = cache.ensure("items", true, 100);
        REQUIRE(handle.has_value());
        if (writes > 0) {
            ++refreshes_with_changes;
        }
        REQUIRE(handle->version() == 1 + refreshes_with_changes);
    }

    // Two concurrent callers after one write: only one of them refreshes.
    write("r2");
    clock.advance(5s);
    std::atomic<int> ok{0};
    std::thread a([&] { ok += cache.ensure("items", true, 100).has_value() ? 1 : 0; });
    std::thread b([&] { ok += cache.ensure("items", true, 100).has_value() ? 1 : 0; });
    a.join();
    b.join();
    REQUIRE(ok.load() == 2);
    ++refreshes_with_changes;
    REQUIRE(cache.peek("items", true)->version == 1 + refreshes_with_changes);

    // A due refresh that finds nothing new keeps the version.
    clock.advance(5s);
    REQUIRE(cache.ensure("items", true, 100)->version() == 1 + refreshes_with_changes);
}

#include <tabula/runtime/result_cache.hpp>

#include <catch2/catch_test_macros.hpp>

namespace {

using namespace tabula;
using runtime::PipelineResult;
using runtime::ResultCache;

auto result_with(std::size_t total) -> PipelineResult {
    PipelineResult result;
    result.total = total;
    result.base_loaded = total;
    return result;
}

auto parts() -> runtime::ResultKeyParts {
    runtime::ResultKeyParts p;
    p.view_id = "v";
    p.table = "items";
    p.table_version = 3;
    p.include_retired = true;
    p.as_of = make_date(2025, 1, 2);
    p.today = make_date(2025, 1, 2);
    p.cap = 500;
    return p;
}

}  // namespace

TEST_CASE("FNV-1a matches the reference vectors") {
    static_assert(runtime::fnv1a64("") == 0xcbf29ce484222325ULL);
    REQUIRE(runtime::fnv1a64("a") == 0xaf63dc4c8601ec8cULL);
    REQUIRE(runtime::fnv1a64("foobar") == 0x85944171f73967e8ULL);
}

TEST_CASE("Result keys cover every input") {
    auto base = runtime::make_result_key(parts());
    REQUIRE(base.starts_with("v:items:3:1:"));
    REQUIRE(base == runtime::make_result_key(parts()));

    auto p = parts();
    p.table_version = 4;
    REQUIRE(runtime::make_result_key(p) != base);

    p = parts();
    p.include_retired = false;
    REQUIRE(runtime::make_result_key(p) != base);

    p = parts();
    p.as_of = make_date(2024, 12, 31);
    REQUIRE(runtime::make_result_key(p) != base);

    p = parts();
    p.cap = 10;
    REQUIRE(runtime::make_result_key(p) != base);

    p = parts();
    p.state.filters["name"] = "ap";
    REQUIRE(runtime::make_result_key(p) != base);
}

TEST_CASE("Second lookup of a key is a hit") {
    ResultCache cache(10);
    int computed = 0;
    auto compute = [&] {
        ++computed;
        return result_with(7);
    };

    auto first = cache.get_or_compute("k", "items", 1, compute);
    REQUIRE_FALSE(first.hit);
    REQUIRE(first.entry->result.total == 7);

    auto second = cache.get_or_compute("k", "items", 1, compute);
    REQUIRE(second.hit);
    REQUIRE(second.entry == first.entry);
    REQUIRE(computed == 1);
}

TEST_CASE("Entries of another table version are recomputed") {
    ResultCache cache(10);
    REQUIRE_FALSE(cache.get_or_compute("k", "items", 1, [] { return result_with(1); }).hit);

    auto refreshed = cache.get_or_compute("k", "items", 2, [] { return result_with(2); });
    REQUIRE_FALSE(refreshed.hit);
    REQUIRE(refreshed.entry->result.total == 2);
    REQUIRE(refreshed.entry->table_version == 2);
    REQUIRE(cache.size() == 1);
}

TEST_CASE("Oldest insertions are evicted first") {
    ResultCache cache(2);
    (void)cache.get_or_compute("a", "items", 1, [] { return result_with(1); });
    (void)cache.get_or_compute("b", "items", 1, [] { return result_with(2); });
    // A hit does not refresh the insertion order.
    REQUIRE(cache.get_or_compute("a", "items", 1, [] { return result_with(1); }).hit);
    (void)cache.get_or_compute("c", "items", 1, [] { return result_with(3); });

    REQUIRE(cache.size() == 2);
    REQUIRE(cache.get_or_compute("b", "items", 1, [] { return result_with(2); }).hit);
    REQUIRE(cache.get_or_compute("c", "items", 1, [] { return result_with(3); }).hit);
}

TEST_CASE("drop_stale removes older versions of one table only") {
    ResultCache cache(10);
    (void)cache.get_or_compute("a1", "a", 1, [] { return result_with(1); });
    (void)cache.get_or_compute("a2", "a", 2, [] { return result_with(1); });
    (void)cache.get_or_compute("b1", "b", 1, [] { return result_with(1); });

    REQUIRE(cache.drop_stale("a", 2) == 1);
    REQUIRE(cache.size() == 2);
    REQUIRE(cache.drop_stale("a", 2) == 0);

    cache.clear();
    REQUIRE(cache.size() == 0);
}

TEST_CASE("Capacity is at least one entry") {
    ResultCache cache(0);
    REQUIRE(cache.max_entries() == 1);
    (void)cache.get_or_compute("a", "t", 1, [] { return result_with(1); });
    (void)cache.get_or_compute("b", "t", 1, [] { return result_with(1); });
    REQUIRE(cache.size() == 1);
}

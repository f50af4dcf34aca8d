#include "bounded_result_cache.hpp"
#include "mediavisor_test.hpp"

#include <json/json.h>

#include <cmath>
#include <limits>
#include <random>
#include <set>
#include <thread>

namespace {
using string_cache = bounded_result_cache<std::string, std::string>;

string_cache make_string_cache(int64_t capacity, uint64_t seed = 1) {
    return string_cache(std::make_unique<random_replacement_store<std::string, std::string>>(capacity, seed));
}

// a value whose entry size, together with a one letter key, is exactly size bytes
std::string value_for_entry_size(int64_t size) { return std::string(size - 3 - 2, 'v'); }
} // namespace

TEST(bounded_result_cache_suite, entry_size_is_encoded_key_and_value) {
    auto cache = make_string_cache(1000);
    cache.cache_set("a", value_for_entry_size(40));
    mediavisor_test_check(cache.cache_total_size(), ==, 40);
    auto items = cache.cache_items();
    mediavisor_test_check(items.size(), ==, 1u);
    mediavisor_test_check(items.at(0).entry_size, ==, 40);
    mediavisor_test_check(items.at(0).entry_key, ==, "a");
}

TEST(bounded_result_cache_suite, no_eviction_within_capacity) {
    auto cache = make_string_cache(1000);
    for (char c = 'a'; c < 'a' + 25; ++c) { cache.cache_set(std::string(1, c), value_for_entry_size(40)); }
    mediavisor_test_check(cache.cache_total_size(), ==, 1000);
    for (char c = 'a'; c < 'a' + 25; ++c) { mediavisor_test_check(cache.cache_get(std::string(1, c)).has_value(), ==, true, c); }
}

TEST(bounded_result_cache_suite, overflow_evicts_exactly_one_older_entry) {
    auto cache = make_string_cache(100);
    cache.cache_set("a", value_for_entry_size(40));
    cache.cache_set("b", value_for_entry_size(40));
    mediavisor_test_check(cache.cache_total_size(), ==, 80);
    cache.cache_set("c", value_for_entry_size(40));

    mediavisor_test_check(cache.cache_total_size(), ==, 80);
    mediavisor_test_check(cache.cache_count(), ==, 2u);
    mediavisor_test_check(cache.cache_get("c").has_value(), ==, true);
    auto survivors = int(cache.cache_get("a").has_value()) + int(cache.cache_get("b").has_value());
    mediavisor_test_check(survivors, ==, 1);
}

TEST(bounded_result_cache_suite, victims_are_random_not_ordered) {
    std::set<std::string> victims;
    for (uint64_t seed = 0; 200 > seed; ++seed) {
        auto cache = make_string_cache(100, seed);
        cache.cache_set("a", value_for_entry_size(40));
        cache.cache_set("b", value_for_entry_size(40));
        cache.cache_get("a");
        cache.cache_set("c", value_for_entry_size(40));
        victims.insert(cache.cache_get("a") ? "b" : "a");
    }
    mediavisor_test_check(victims.size(), ==, 2u);
}

TEST(bounded_result_cache_suite, oversized_item_is_kept_alone) {
    auto cache = make_string_cache(100);
    cache.cache_set("a", value_for_entry_size(40));
    cache.cache_set("b", value_for_entry_size(40));
    cache.cache_set("z", value_for_entry_size(150));
    mediavisor_test_check(cache.cache_count(), ==, 1u);
    mediavisor_test_check(cache.cache_get("z").has_value(), ==, true);
    mediavisor_test_check(cache.cache_total_size(), ==, 150);

    // the next insertion brings the total back under capacity
    cache.cache_set("d", value_for_entry_size(40));
    mediavisor_test_check(cache.cache_count(), ==, 1u);
    mediavisor_test_check(cache.cache_get("d").has_value(), ==, true);
    mediavisor_test_check(cache.cache_total_size(), ==, 40);
}

TEST(bounded_result_cache_suite, set_existing_key_replaces_size) {
    auto cache = make_string_cache(100);
    cache.cache_set("a", value_for_entry_size(90));
    cache.cache_set("a", value_for_entry_size(10));
    mediavisor_test_check(cache.cache_total_size(), ==, 10);
    mediavisor_test_check(cache.cache_count(), ==, 1u);
    mediavisor_test_check(*cache.cache_get("a"), ==, value_for_entry_size(10));
}

TEST(bounded_result_cache_suite, unencodable_value_counts_as_zero) {
    auto since = now_unixtime();
    bounded_result_cache<std::string, Json::Value> cache(std::make_unique<random_replacement_store<std::string, Json::Value>>(100));
    cache.cache_set("a", Json::Value(std::numeric_limits<double>::quiet_NaN()));
    mediavisor_test_check(cache.cache_count(), ==, 1u);
    mediavisor_test_check(cache.cache_total_size(), ==, 3);
    auto got = cache.cache_get("a");
    mediavisor_test_check(got.has_value(), ==, true);
    mediavisor_test_check(std::isnan(got->asDouble()), ==, true);
    mediavisor_test_check(mediavisor_test_logged("bounded_result_cache_size_error", since), >=, 1u);
}

TEST(bounded_result_cache_suite, items_is_a_copy) {
    auto cache = make_string_cache(1000);
    cache.cache_set("a", "1");
    auto items = cache.cache_items();
    cache.cache_set("b", "2");
    mediavisor_test_check(items.size(), ==, 1u);
    mediavisor_test_check(cache.cache_items().size(), ==, 2u);
}

TEST(bounded_result_cache_suite, concurrent_set_and_get_stay_within_capacity) {
    auto cache = make_string_cache(2000);
    std::vector<std::thread> threads;
    for (int t = 0; 8 > t; ++t) {
        threads.emplace_back([&cache, t] {
            std::mt19937 rng(t);
            for (int n = 0; 2000 > n; ++n) {
                auto key = str("k", rng() % 300);
                if (rng() % 2) {
                    cache.cache_set(key, std::string(rng() % 50, 'x'));
                } else {
                    cache.cache_get(key);
                }
                if (n % 100 == 0) { cache.cache_items(); }
            }
        });
    }
    for (auto &t : threads) { t.join(); }

    mediavisor_test_check(cache.cache_total_size(), <=, 2000);
    int64_t summed = 0;
    for (auto const &item : cache.cache_items()) { summed += item.entry_size; }
    mediavisor_test_check(summed, ==, cache.cache_total_size());
}

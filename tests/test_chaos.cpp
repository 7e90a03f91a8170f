#include "kv_cache/cache.hpp"
#include "kv_cache/memory_store.hpp"

#include "test_support.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <random>
#include <thread>

using namespace kv_cache;
using namespace kv_cache::testing;
using namespace std::chrono_literals;

TEST_CASE("chaos churn keeps dependents consistent", "[chaos]") {
  auto store = std::make_unique<MemoryStore>();
  MemoryStore *raw = store.get();
  auto t = make_test_cache(std::move(store));
  auto &cache = *t.cache;
  std::mt19937_64 rng(42);

  for (int i = 0; i < 20000; ++i) {
    const auto key = std::string("k") + std::to_string(rng() % 200);
    const auto partition = std::string("p") + std::to_string(rng() % 3);
    switch (rng() % 6) {
    case 0:
      cache.add_static(partition, key, static_cast<int>(i));
      break;
    case 1:
      cache.add_timed(partition, key, std::string(rng() % 64, 'a'),
                      Duration(rng() % 5000 + 1));
      break;
    case 2: {
      const auto parent = std::string("k") + std::to_string(rng() % 200);
      if (parent != key)
        cache.add_sliding(partition, key, 1, 2s, {parent});
      break;
    }
    case 3:
      cache.get<int>(partition, key);
      break;
    case 4:
      cache.remove(partition, key);
      break;
    default:
      t.clock->advance(Duration(rng() % 500));
      break;
    }
  }

  std::int64_t bytes = 0;
  EntryFilter all;
  all.mode = ReadMode::IgnoreExpiry;
  for (const auto &entry : raw->scan(all)) {
    bytes += static_cast<std::int64_t>(entry.value.size());
    for (const auto parent : entry.parent_fingerprints)
      CHECK(raw->read(parent).has_value());
  }
  CHECK(raw->size_bytes() == bytes);
}

TEST_CASE("concurrent writers and readers do not tear entries", "[chaos]") {
  for (const auto &store : store_names()) {
    DYNAMIC_SECTION("store " << store) {
      auto t = make_test_cache(store);
      auto &cache = *t.cache;
      std::atomic<int> torn{0};
      std::vector<std::thread> workers;
      for (int w = 0; w < 4; ++w) {
        workers.emplace_back([&cache, &torn, w] {
          const std::string mine(100, static_cast<char>('a' + w));
          for (int i = 0; i < 200; ++i) {
            cache.add_sliding("p", "shared", mine, 1min);
            const auto v = cache.get<std::string>("p", "shared");
            if (v && (v->size() != 100 ||
                      v->find_first_not_of(v->front()) != std::string::npos))
              ++torn;
          }
        });
      }
      for (auto &th : workers)
        th.join();
      CHECK(torn.load() == 0);
      const auto v = cache.get<std::string>("p", "shared");
      REQUIRE(v.has_value());
      CHECK(v->find_first_not_of(v->front()) == std::string::npos);
      CHECK(cache.count("p") == 1);
      CHECK_FALSE(cache.last_error().has_value());
    }
  }
}

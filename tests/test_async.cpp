#include "kv_cache/async_cache.hpp"

#include "test_support.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <string>
#include <vector>

using namespace kv_cache;
using namespace kv_cache::testing;
using namespace std::chrono_literals;

TEST_CASE("async surface mirrors the synchronous one", "[async]") {
  for (const auto &store : store_names()) {
    DYNAMIC_SECTION("store " << store) {
      auto t = make_test_cache(store);
      AsyncCache async(t.cache);

      async.add_static("p", "k", std::string("v")).get();
      async.add_sliding("p", "s", 5, 1min).get();
      async.add_timed("p", "t", 6, 1min).get();
      CHECK(async.get<std::string>("p", "k").get() == std::string("v"));
      CHECK(async.peek<int>("p", "s").get() == 5);
      CHECK(async.get_item<int>("p", "t").get()->value == 6);
      CHECK(async.peek_item<int>("p", "t").get()->interval == Duration::zero());
      CHECK(async.contains("p", "k").get());
      CHECK(async.long_count("p").get() == 3);
      CHECK(async.long_count().get() == 3);

      async.remove("p", "k").get();
      CHECK_FALSE(async.contains("p", "k").get());
      CHECK(async.clear("p").get() == 2);
      CHECK(async.clear().get() == 0);
    }
  }
}

TEST_CASE("canceled async writes leave the store untouched", "[async]") {
  auto t = make_test_cache("memory");
  AsyncCache async(t.cache);
  std::stop_source source;
  source.request_stop();

  auto write = async.add_static("p", "k", 1, {}, source.get_token());
  CHECK_THROWS_AS(write.get(), OperationCanceledError);
  CHECK_FALSE(t.cache->contains("p", "k"));

  t.cache->add_static("p", "k", 1);
  auto del = async.remove("p", "k", source.get_token());
  CHECK_THROWS_AS(del.get(), OperationCanceledError);
  CHECK(t.cache->contains("p", "k"));

  auto wipe = async.clear(ReadMode::IgnoreExpiry, source.get_token());
  CHECK_THROWS_AS(wipe.get(), OperationCanceledError);
  CHECK(t.cache->count() == 1);

  int calls = 0;
  auto made = async.get_or_add(
      "p", "other", [&calls] { return ++calls; }, ExpiryPolicy::fixed_static(),
      {}, source.get_token());
  CHECK_THROWS_AS(made.get(), OperationCanceledError);
  CHECK(calls == 0);
  CHECK_FALSE(t.cache->contains("p", "other"));
}

TEST_CASE("async get_or_add calls the factory once", "[async]") {
  auto t = make_test_cache("memory");
  AsyncCache async(t.cache);
  std::atomic<int> calls{0};
  auto factory = [&calls] {
    ++calls;
    return std::string("fresh");
  };
  CHECK(async.get_or_add("p", "k", factory, ExpiryPolicy::sliding(1min))
            .get() == "fresh");
  CHECK(async.get_or_add("p", "k", factory, ExpiryPolicy::sliding(1min))
            .get() == "fresh");
  CHECK(calls.load() == 1);
}

TEST_CASE("async argument errors surface through the future", "[async]") {
  auto t = make_test_cache("memory");
  AsyncCache async(t.cache);
  auto bad = async.add_static("", "k", 1);
  CHECK_THROWS_AS(bad.get(), InvalidArgumentError);
  CHECK_THROWS_AS(AsyncCache(nullptr), InvalidArgumentError);
}

TEST_CASE("async get_or_add validates parents before the factory",
          "[async]") {
  auto t = make_test_cache("memory");
  AsyncCache async(t.cache);
  std::vector<std::string> parents(t.cache->max_parent_keys() + 1, "parent");
  std::atomic<int> calls{0};
  auto made = async.get_or_add_static(
      "p", "k", [&calls] { return ++calls; }, parents);
  CHECK_THROWS_AS(made.get(), TooManyParentKeysError);
  CHECK(calls.load() == 0);

  auto empty_parent = async.get_or_add_sliding(
      "p", "k", [&calls] { return ++calls; }, 1min, {""});
  CHECK_THROWS_AS(empty_parent.get(), InvalidArgumentError);
  CHECK(calls.load() == 0);
  CHECK_FALSE(t.cache->contains("p", "k"));
}

TEST_CASE("async get_or_add stops between the factory and the write",
          "[async]") {
  auto t = make_test_cache("memory");
  AsyncCache async(t.cache);
  std::stop_source source;
  auto made = async.get_or_add_static(
      "p", "k",
      [&source] {
        source.request_stop();
        return 1;
      },
      {}, source.get_token());
  CHECK_THROWS_AS(made.get(), OperationCanceledError);
  CHECK_FALSE(t.cache->contains("p", "k"));
}

TEST_CASE("async overloads cover every expiry and query", "[async]") {
  auto t = make_test_cache("memory");
  AsyncCache async(t.cache);
  const auto start = t.clock->now();

  async.add_timed("p", "at", 1, start + 1min).get();
  CHECK(t.cache->peek_item<int>("p", "at")->utc_expiry == start + 1min);

  CHECK(async.get_or_add_sliding("p", "s", [] { return 2; }, 1min).get() ==
        2);
  CHECK(t.cache->peek_item<int>("p", "s")->interval == 1min);
  CHECK(async.get_or_add_static("p", "st", [] { return 3; }).get() == 3);
  CHECK(async.get_or_add_timed("p", "tf", [] { return 4; }, 1min).get() == 4);
  CHECK(async.get_or_add_timed("q", "ta", [] { return 5; }, start + 1h)
            .get() == 5);
  CHECK(t.cache->peek_item<int>("q", "ta")->utc_expiry == start + 1h);

  CHECK(async.count().get() == 5);
  CHECK(async.count("p").get() == 4);
  CHECK(async.cache_size_bytes().get() == t.cache->cache_size_bytes());
  CHECK(async.cache_size_bytes().get() > 0);

  const auto items = async.get_items<int>("q").get();
  REQUIRE(items.size() == 1);
  CHECK(items[0].value == 5);
  CHECK(async.peek_items<int>().get().size() == 5);
  CHECK(async.get_items<int>().get().size() == 5);
}

#include "kv_cache/cache.hpp"
#include "kv_cache/fingerprint.hpp"
#include "kv_cache/sqlite_store.hpp"

#include "test_support.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <random>

using namespace kv_cache;
using namespace kv_cache::testing;
using namespace std::chrono_literals;

namespace {
// Temporary database file, removed with its WAL companions.
class TempDb {
public:
  TempDb() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("kv_cache_test_" + std::to_string(rd()) + ".sqlite");
  }
  ~TempDb() {
    std::error_code ec;
    for (const char *suffix : {"", "-wal", "-shm"})
      std::filesystem::remove(path_.string() + suffix, ec);
  }
  std::string path() const { return path_.string(); }

private:
  std::filesystem::path path_;
};

StoredEntry make_entry(const std::string &partition, const std::string &key,
                       std::vector<std::string> parents = {}) {
  StoredEntry e;
  e.partition = partition;
  e.key = key;
  e.fingerprint = fingerprint(partition, key);
  e.value = {1, 2, 3};
  e.utc_creation = start_time();
  e.utc_expiry = start_time() + 1h;
  e.interval = 1h;
  for (const auto &p : parents) {
    e.parent_fingerprints.push_back(fingerprint(partition, p));
    e.parent_keys.push_back(p);
  }
  return e;
}

EntryFilter everything() {
  EntryFilter f;
  f.mode = ReadMode::IgnoreExpiry;
  return f;
}
} // namespace

TEST_CASE("sqlite store names its mode", "[sqlite]") {
  TempDb db;
  CHECK(SqliteStore(SqliteStoreConfig{}).name() == "volatile");
  SqliteStoreConfig cfg;
  cfg.path = db.path();
  CHECK(SqliteStore(cfg).name() == "persistent");
}

TEST_CASE("sqlite store round trips rows", "[sqlite]") {
  SqliteStore store(SqliteStoreConfig{});
  auto entry = make_entry("p", "k");
  entry.compressed = true;
  store.upsert(make_entry("p", "parent"));
  entry.parent_keys = {"parent"};
  entry.parent_fingerprints = {fingerprint("p", "parent")};
  store.upsert(entry);

  const auto back = store.read(entry.fingerprint);
  REQUIRE(back.has_value());
  CHECK(back->partition == "p");
  CHECK(back->key == "k");
  CHECK(back->value == entry.value);
  CHECK(back->compressed);
  CHECK(back->utc_creation == entry.utc_creation);
  CHECK(back->utc_expiry == entry.utc_expiry);
  CHECK(back->interval == entry.interval);
  CHECK(back->parent_keys == entry.parent_keys);
  CHECK(back->parent_fingerprints == entry.parent_fingerprints);

  CHECK(store.renew(entry.fingerprint, start_time() + 30min) ==
        start_time() + 90min);
  CHECK(store.read(entry.fingerprint)->utc_expiry == start_time() + 90min);
  CHECK_FALSE(store.read(fingerprint("p", "nope")).has_value());
}

TEST_CASE("sqlite store cascades deletes through parent keys", "[sqlite]") {
  SqliteStore store(SqliteStoreConfig{});
  store.upsert(make_entry("p", "root"));
  store.upsert(make_entry("p", "mid", {"root"}));
  store.upsert(make_entry("p", "leaf", {"mid"}));
  store.upsert(make_entry("p", "other"));

  CHECK(store.erase(fingerprint("p", "root")));
  CHECK_FALSE(store.read(fingerprint("p", "mid")).has_value());
  CHECK_FALSE(store.read(fingerprint("p", "leaf")).has_value());
  CHECK(store.count_where(everything()) == 1);
  CHECK_FALSE(store.erase(fingerprint("p", "root")));
}

TEST_CASE("sqlite erase_where counts only matched rows", "[sqlite]") {
  SqliteStore store(SqliteStoreConfig{});
  store.upsert(make_entry("a", "parent"));
  store.upsert(make_entry("a", "child", {"parent"}));
  store.upsert(make_entry("b", "x"));

  EntryFilter f = everything();
  f.partition = "a";
  auto only_parent = make_entry("a", "parent");
  only_parent.utc_expiry = start_time();
  store.upsert(only_parent);

  EntryFilter expired{std::string("a"), ReadMode::ConsiderExpiry,
                      start_time() + 1min, true};
  CHECK(store.erase_where(expired) == 1);
  CHECK(store.count_where(f) == 0);
  CHECK(store.count_where(everything()) == 1);
}

TEST_CASE("sqlite upsert refuses a missing parent", "[sqlite]") {
  SqliteStore store(SqliteStoreConfig{});
  CHECK_THROWS_AS(store.upsert(make_entry("p", "orphan", {"ghost"})),
                  StoreError);
  CHECK(store.count_where(everything()) == 0);
}

TEST_CASE("persistent cache survives a reopen", "[sqlite]") {
  TempDb db;
  CacheSettings settings;
  settings.store = "persistent";
  settings.cache_file = db.path();
  auto clock = std::make_shared<ManualClock>(start_time());
  {
    Cache cache(settings, make_store_by_name("persistent", settings), clock);
    cache.add_static("p", "parent", std::string("kept"));
    cache.add_sliding("p", "child", 7, 10min, {"parent"});
  }
  {
    Cache cache(settings, make_store_by_name("persistent", settings), clock);
    CHECK(cache.get<std::string>("p", "parent") == std::string("kept"));
    CHECK(cache.get<int>("p", "child") == 7);
    cache.remove("p", "parent");
    CHECK_FALSE(cache.contains("p", "child"));
  }
}

TEST_CASE("sqlite vacuum keeps data", "[sqlite]") {
  TempDb db;
  SqliteStoreConfig cfg;
  cfg.path = db.path();
  SqliteStore store(cfg);
  for (int i = 0; i < 50; ++i)
    store.upsert(make_entry("p", "k" + std::to_string(i)));
  CHECK(store.erase_where(everything()) == 50);
  store.upsert(make_entry("p", "survivor"));
  CHECK_NOTHROW(store.vacuum());
  CHECK(store.read(fingerprint("p", "survivor")).has_value());
  CHECK(store.size_bytes() == 3);
}

TEST_CASE("sqlite store reports open failures", "[sqlite]") {
  SqliteStoreConfig cfg;
  cfg.path = "/nonexistent-dir/for/kv_cache/test.sqlite";
  CHECK_THROWS_AS(SqliteStore(cfg), StoreError);
}

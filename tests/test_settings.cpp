#include "kv_cache/cache.hpp"
#include "kv_cache/settings.hpp"

#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>

using namespace kv_cache;

namespace {
void write_file(const char *path, const std::string &text) {
  std::ofstream out(path);
  out << text;
}
} // namespace

TEST_CASE("default settings are valid", "[settings]") {
  CacheSettings s;
  std::string err;
  CHECK(validate_settings(s, &err));
  CHECK(s.default_partition == "kv_cache.default");
  CHECK(s.static_interval == std::chrono::hours(24 * 30));
  CHECK(s.insertions_before_auto_clean == 256);
  CHECK(s.max_cache_size_mb == 1024);
}

TEST_CASE("settings load from JSON with clamping", "[settings]") {
  const char *path = "kv_cache_settings_ok.json";
  write_file(path, R"({"default_partition":"app","static_interval_days":99999,
    "insertions_before_auto_clean":10,"max_cache_size_mb":0,
    "compressor":"none","store":"volatile","busy_timeout_ms":250})");
  CacheSettings s;
  std::string err;
  REQUIRE(load_settings(path, s, &err));
  CHECK(s.default_partition == "app");
  CHECK(s.static_interval == std::chrono::hours(24 * 3650));
  CHECK(s.insertions_before_auto_clean == 10);
  CHECK(s.max_cache_size_mb == 1);
  CHECK(s.compressor == "none");
  CHECK(s.store == "volatile");
  CHECK(s.busy_timeout_ms == 250);
  std::remove(path);
}

TEST_CASE("invalid settings leave the target untouched", "[settings]") {
  const char *path = "kv_cache_settings_bad.json";
  write_file(path, R"({"default_partition":"changed","store":"redis"})");
  CacheSettings s;
  std::string err;
  CHECK_FALSE(load_settings(path, s, &err));
  CHECK(err == "unknown store");
  CHECK(s.default_partition == "kv_cache.default");
  std::remove(path);

  CHECK_FALSE(load_settings("does-not-exist.json", s, &err));
  CHECK(err == "settings file not found");

  write_file(path, "not json");
  CHECK_FALSE(load_settings(path, s, &err));
  CHECK(err == "invalid schema");
  std::remove(path);
}

TEST_CASE("cache refuses invalid settings and unknown stores", "[settings]") {
  CacheSettings s;
  s.default_partition.clear();
  CHECK_THROWS_AS(Cache(s, make_store_by_name("memory", CacheSettings{})),
                  InvalidArgumentError);
  CHECK_THROWS_AS(make_store_by_name("redis", CacheSettings{}),
                  InvalidArgumentError);
  CHECK(make_store_by_name("memory", CacheSettings{})->name() == "memory");
  CHECK(make_store_by_name("volatile", CacheSettings{})->name() == "volatile");
}

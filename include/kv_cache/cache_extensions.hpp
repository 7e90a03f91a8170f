#pragma once

#include "kv_cache/cache.hpp"

// Overloads that target CacheSettings::default_partition.
namespace kv_cache::default_partition {

template <typename T>
void add_sliding(Cache &cache, const std::string &key, const T &value,
                 Duration interval,
                 const std::vector<std::string> &parent_keys = {}) {
  cache.add_sliding(cache.settings().default_partition, key, value, interval,
                    parent_keys);
}

template <typename T>
void add_static(Cache &cache, const std::string &key, const T &value,
                const std::vector<std::string> &parent_keys = {}) {
  cache.add_static(cache.settings().default_partition, key, value,
                   parent_keys);
}

template <typename T>
void add_timed(Cache &cache, const std::string &key, const T &value,
               TimePoint utc_expiry,
               const std::vector<std::string> &parent_keys = {}) {
  cache.add_timed(cache.settings().default_partition, key, value, utc_expiry,
                  parent_keys);
}

template <typename T>
void add_timed(Cache &cache, const std::string &key, const T &value,
               Duration lifetime,
               const std::vector<std::string> &parent_keys = {}) {
  cache.add_timed(cache.settings().default_partition, key, value, lifetime,
                  parent_keys);
}

template <typename T> CacheResult<T> get(Cache &cache, const std::string &key) {
  return cache.get<T>(cache.settings().default_partition, key);
}

template <typename T>
CacheResult<CacheItem<T>> get_item(Cache &cache, const std::string &key) {
  return cache.get_item<T>(cache.settings().default_partition, key);
}

template <typename T>
CacheResult<T> peek(Cache &cache, const std::string &key) {
  return cache.peek<T>(cache.settings().default_partition, key);
}

template <typename T>
CacheResult<CacheItem<T>> peek_item(Cache &cache, const std::string &key) {
  return cache.peek_item<T>(cache.settings().default_partition, key);
}

template <typename Factory>
auto get_or_add_sliding(Cache &cache, const std::string &key,
                        Factory &&factory, Duration interval,
                        const std::vector<std::string> &parent_keys = {}) {
  return cache.get_or_add_sliding(cache.settings().default_partition, key,
                                  std::forward<Factory>(factory), interval,
                                  parent_keys);
}

template <typename Factory>
auto get_or_add_static(Cache &cache, const std::string &key, Factory &&factory,
                       const std::vector<std::string> &parent_keys = {}) {
  return cache.get_or_add_static(cache.settings().default_partition, key,
                                 std::forward<Factory>(factory), parent_keys);
}

template <typename Factory>
auto get_or_add_timed(Cache &cache, const std::string &key, Factory &&factory,
                      Duration lifetime,
                      const std::vector<std::string> &parent_keys = {}) {
  return cache.get_or_add_timed(cache.settings().default_partition, key,
                                std::forward<Factory>(factory), lifetime,
                                parent_keys);
}

inline void remove(Cache &cache, const std::string &key) {
  cache.remove(cache.settings().default_partition, key);
}

inline bool contains(Cache &cache, const std::string &key) {
  return cache.contains(cache.settings().default_partition, key);
}

inline int count(Cache &cache, ReadMode mode = ReadMode::ConsiderExpiry) {
  return cache.count(cache.settings().default_partition, mode);
}

inline std::int64_t clear(Cache &cache,
                          ReadMode mode = ReadMode::IgnoreExpiry) {
  return cache.clear(cache.settings().default_partition, mode);
}

} // namespace kv_cache::default_partition

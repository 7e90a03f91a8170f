#include "kv_cache/async_cache.hpp"

namespace kv_cache {

AsyncCache::AsyncCache(std::shared_ptr<Cache> cache) : cache_(std::move(cache)) {
  if (!cache_)
    throw InvalidArgumentError("cache must not be null");
}

std::future<void> AsyncCache::remove(std::string partition, std::string key,
                                     std::stop_token stop) {
  return run(std::move(stop), [c = cache_, partition = std::move(partition),
                               key = std::move(key)] {
    c->remove(partition, key);
  });
}

std::future<std::int64_t> AsyncCache::clear(ReadMode mode,
                                            std::stop_token stop) {
  return run(std::move(stop), [c = cache_, mode] { return c->clear(mode); });
}

std::future<std::int64_t> AsyncCache::clear(std::string partition,
                                            ReadMode mode,
                                            std::stop_token stop) {
  return run(std::move(stop),
             [c = cache_, partition = std::move(partition), mode] {
               return c->clear(partition, mode);
             });
}

std::future<std::int64_t> AsyncCache::long_count(ReadMode mode,
                                                 std::stop_token stop) {
  return run(std::move(stop),
             [c = cache_, mode] { return c->long_count(mode); });
}

std::future<std::int64_t> AsyncCache::long_count(std::string partition,
                                                 ReadMode mode,
                                                 std::stop_token stop) {
  return run(std::move(stop),
             [c = cache_, partition = std::move(partition), mode] {
               return c->long_count(partition, mode);
             });
}

std::future<int> AsyncCache::count(ReadMode mode, std::stop_token stop) {
  return run(std::move(stop), [c = cache_, mode] { return c->count(mode); });
}

std::future<int> AsyncCache::count(std::string partition, ReadMode mode,
                                   std::stop_token stop) {
  return run(std::move(stop),
             [c = cache_, partition = std::move(partition), mode] {
               return c->count(partition, mode);
             });
}

std::future<bool> AsyncCache::contains(std::string partition, std::string key,
                                       std::stop_token stop) {
  return run(std::move(stop), [c = cache_, partition = std::move(partition),
                               key = std::move(key)] {
    return c->contains(partition, key);
  });
}

std::future<std::int64_t> AsyncCache::cache_size_bytes(std::stop_token stop) {
  return run(std::move(stop), [c = cache_] { return c->cache_size_bytes(); });
}

} // namespace kv_cache

#pragma once

#include "kv_cache/cache.hpp"

#include <future>
#include <memory>
#include <optional>
#include <stop_token>

namespace kv_cache {

// Future based front for a shared Cache. Every call runs the synchronous
// operation on its own task. A stop request seen before the store call makes
// future::get() throw OperationCanceledError and leaves the store untouched.
// Once the store call has started the operation runs to completion.
class AsyncCache {
public:
  explicit AsyncCache(std::shared_ptr<Cache> cache);

  Cache &cache() { return *cache_; }

  template <typename T>
  std::future<void> add(std::string partition, std::string key, T value,
                        ExpiryPolicy policy,
                        std::vector<std::string> parent_keys = {},
                        std::stop_token stop = {}) {
    return run(std::move(stop),
               [c = cache_, partition = std::move(partition),
                key = std::move(key), value = std::move(value), policy,
                parent_keys = std::move(parent_keys)] {
                 c->add(partition, key, value, policy, parent_keys);
               });
  }

  template <typename T>
  std::future<void> add_sliding(std::string partition, std::string key,
                                T value, Duration interval,
                                std::vector<std::string> parent_keys = {},
                                std::stop_token stop = {}) {
    return add(std::move(partition), std::move(key), std::move(value),
               ExpiryPolicy::sliding(interval), std::move(parent_keys),
               std::move(stop));
  }

  template <typename T>
  std::future<void> add_static(std::string partition, std::string key,
                               T value,
                               std::vector<std::string> parent_keys = {},
                               std::stop_token stop = {}) {
    return add(std::move(partition), std::move(key), std::move(value),
               ExpiryPolicy::fixed_static(), std::move(parent_keys),
               std::move(stop));
  }

  template <typename T>
  std::future<void> add_timed(std::string partition, std::string key, T value,
                              TimePoint utc_expiry,
                              std::vector<std::string> parent_keys = {},
                              std::stop_token stop = {}) {
    return add(std::move(partition), std::move(key), std::move(value),
               ExpiryPolicy::timed_at(utc_expiry), std::move(parent_keys),
               std::move(stop));
  }

  template <typename T>
  std::future<void> add_timed(std::string partition, std::string key, T value,
                              Duration lifetime,
                              std::vector<std::string> parent_keys = {},
                              std::stop_token stop = {}) {
    return add(std::move(partition), std::move(key), std::move(value),
               ExpiryPolicy::timed_for(lifetime), std::move(parent_keys),
               std::move(stop));
  }

  template <typename T>
  std::future<CacheResult<T>> get(std::string partition, std::string key,
                                  std::stop_token stop = {}) {
    return run(std::move(stop), [c = cache_, partition = std::move(partition),
                                 key = std::move(key)] {
      return c->get<T>(partition, key);
    });
  }

  template <typename T>
  std::future<CacheResult<CacheItem<T>>>
  get_item(std::string partition, std::string key, std::stop_token stop = {}) {
    return run(std::move(stop), [c = cache_, partition = std::move(partition),
                                 key = std::move(key)] {
      return c->get_item<T>(partition, key);
    });
  }

  template <typename T>
  std::future<CacheResult<T>> peek(std::string partition, std::string key,
                                   std::stop_token stop = {}) {
    return run(std::move(stop), [c = cache_, partition = std::move(partition),
                                 key = std::move(key)] {
      return c->peek<T>(partition, key);
    });
  }

  template <typename T>
  std::future<CacheResult<CacheItem<T>>>
  peek_item(std::string partition, std::string key, std::stop_token stop = {}) {
    return run(std::move(stop), [c = cache_, partition = std::move(partition),
                                 key = std::move(key)] {
      return c->peek_item<T>(partition, key);
    });
  }

  // Runs Cache::get_or_add. Cancellation is checked before the lookup, before
  // the factory and before the write. A stop request after the factory ran
  // drops its value.
  template <typename Factory>
  auto get_or_add(std::string partition, std::string key, Factory factory,
                  ExpiryPolicy policy,
                  std::vector<std::string> parent_keys = {},
                  std::stop_token stop = {})
      -> std::future<std::decay_t<std::invoke_result_t<Factory &>>> {
    using T = std::decay_t<std::invoke_result_t<Factory &>>;
    return run(stop, [c = cache_, partition = std::move(partition),
                      key = std::move(key), factory = std::move(factory),
                      policy, parent_keys = std::move(parent_keys),
                      stop]() mutable {
      return c->get_or_add(
          partition, key,
          [&factory, &stop]() -> T {
            throw_if_stopped(stop);
            T value = std::invoke(factory);
            throw_if_stopped(stop);
            return value;
          },
          policy, parent_keys);
    });
  }

  template <typename Factory>
  auto get_or_add_sliding(std::string partition, std::string key,
                          Factory factory, Duration interval,
                          std::vector<std::string> parent_keys = {},
                          std::stop_token stop = {}) {
    return get_or_add(std::move(partition), std::move(key), std::move(factory),
                      ExpiryPolicy::sliding(interval), std::move(parent_keys),
                      std::move(stop));
  }

  template <typename Factory>
  auto get_or_add_static(std::string partition, std::string key,
                         Factory factory,
                         std::vector<std::string> parent_keys = {},
                         std::stop_token stop = {}) {
    return get_or_add(std::move(partition), std::move(key), std::move(factory),
                      ExpiryPolicy::fixed_static(), std::move(parent_keys),
                      std::move(stop));
  }

  template <typename Factory>
  auto get_or_add_timed(std::string partition, std::string key,
                        Factory factory, TimePoint utc_expiry,
                        std::vector<std::string> parent_keys = {},
                        std::stop_token stop = {}) {
    return get_or_add(std::move(partition), std::move(key), std::move(factory),
                      ExpiryPolicy::timed_at(utc_expiry),
                      std::move(parent_keys), std::move(stop));
  }

  template <typename Factory>
  auto get_or_add_timed(std::string partition, std::string key,
                        Factory factory, Duration lifetime,
                        std::vector<std::string> parent_keys = {},
                        std::stop_token stop = {}) {
    return get_or_add(std::move(partition), std::move(key), std::move(factory),
                      ExpiryPolicy::timed_for(lifetime),
                      std::move(parent_keys), std::move(stop));
  }

  template <typename T>
  std::future<std::vector<CacheItem<T>>>
  get_items(std::optional<std::string> partition = std::nullopt,
            std::stop_token stop = {}) {
    return run(std::move(stop), [c = cache_, partition = std::move(partition)] {
      return c->get_items<T>(partition);
    });
  }

  template <typename T>
  std::future<std::vector<CacheItem<T>>>
  peek_items(std::optional<std::string> partition = std::nullopt,
             std::stop_token stop = {}) {
    return run(std::move(stop), [c = cache_, partition = std::move(partition)] {
      return c->peek_items<T>(partition);
    });
  }

  std::future<void> remove(std::string partition, std::string key,
                           std::stop_token stop = {});
  std::future<std::int64_t> clear(ReadMode mode = ReadMode::IgnoreExpiry,
                                  std::stop_token stop = {});
  std::future<std::int64_t> clear(std::string partition,
                                  ReadMode mode = ReadMode::IgnoreExpiry,
                                  std::stop_token stop = {});
  std::future<std::int64_t> long_count(ReadMode mode = ReadMode::ConsiderExpiry,
                                       std::stop_token stop = {});
  std::future<std::int64_t> long_count(std::string partition,
                                       ReadMode mode = ReadMode::ConsiderExpiry,
                                       std::stop_token stop = {});
  std::future<int> count(ReadMode mode = ReadMode::ConsiderExpiry,
                         std::stop_token stop = {});
  std::future<int> count(std::string partition,
                         ReadMode mode = ReadMode::ConsiderExpiry,
                         std::stop_token stop = {});
  std::future<bool> contains(std::string partition, std::string key,
                             std::stop_token stop = {});
  std::future<std::int64_t> cache_size_bytes(std::stop_token stop = {});

private:
  static void throw_if_stopped(const std::stop_token &stop) {
    if (stop.stop_requested())
      throw OperationCanceledError();
  }

  template <typename Fn>
  static auto run(std::stop_token stop, Fn fn)
      -> std::future<std::invoke_result_t<Fn &>> {
    return std::async(std::launch::async,
                      [stop = std::move(stop), fn = std::move(fn)]() mutable {
                        throw_if_stopped(stop);
                        return fn();
                      });
  }

  std::shared_ptr<Cache> cache_;
};

} // namespace kv_cache

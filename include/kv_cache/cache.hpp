#pragma once

#include "kv_cache/clock.hpp"
#include "kv_cache/codec.hpp"
#include "kv_cache/errors.hpp"
#include "kv_cache/expiry.hpp"
#include "kv_cache/settings.hpp"
#include "kv_cache/store.hpp"
#include "kv_cache/types.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace kv_cache {

// Partition scoped cache over an IStore.
//
// Argument errors (empty partition or key, bad parent keys, invalid expiry,
// values the codec refuses) throw. Everything the store or the codec does
// wrong at runtime is logged, kept in last_error() and turned into a miss, a
// zero or a no-op.
class Cache {
public:
  Cache(CacheSettings settings, std::unique_ptr<IStore> store,
        std::shared_ptr<IClock> clock = std::make_shared<SystemClock>());

  const CacheSettings &settings() const { return settings_; }
  IStore &store() { return *store_; }
  const IClock &clock() const { return *clock_; }
  bool can_peek() const { return store_->can_peek(); }
  std::size_t max_parent_keys() const { return store_->max_parent_keys(); }

  template <typename T>
  void add(const std::string &partition, const std::string &key,
           const T &value, const ExpiryPolicy &policy,
           const std::vector<std::string> &parent_keys = {}) {
    const auto id = resolve(partition, key);
    auto parents = resolve_parents(id, parent_keys);
    const auto now = clock_->now();
    store_value(id, std::move(parents), value,
                compute_expiry(policy, now, settings_.static_interval), now);
  }

  template <typename T>
  void add_sliding(const std::string &partition, const std::string &key,
                   const T &value, Duration interval,
                   const std::vector<std::string> &parent_keys = {}) {
    add(partition, key, value, ExpiryPolicy::sliding(interval), parent_keys);
  }

  template <typename T>
  void add_static(const std::string &partition, const std::string &key,
                  const T &value,
                  const std::vector<std::string> &parent_keys = {}) {
    add(partition, key, value, ExpiryPolicy::fixed_static(), parent_keys);
  }

  template <typename T>
  void add_timed(const std::string &partition, const std::string &key,
                 const T &value, TimePoint utc_expiry,
                 const std::vector<std::string> &parent_keys = {}) {
    add(partition, key, value, ExpiryPolicy::timed_at(utc_expiry),
        parent_keys);
  }

  template <typename T>
  void add_timed(const std::string &partition, const std::string &key,
                 const T &value, Duration lifetime,
                 const std::vector<std::string> &parent_keys = {}) {
    add(partition, key, value, ExpiryPolicy::timed_for(lifetime), parent_keys);
  }

  template <typename T>
  CacheResult<T> get(const std::string &partition, const std::string &key) {
    auto item = get_item<T>(partition, key);
    if (!item)
      return std::nullopt;
    return std::move(item->value);
  }

  template <typename T>
  CacheResult<CacheItem<T>> get_item(const std::string &partition,
                                     const std::string &key) {
    const auto id = resolve(partition, key);
    auto entry = fetch(id, /*renew=*/true);
    if (!entry)
      return std::nullopt;
    return decode_item<T>(*entry);
  }

  // Every valid item of a partition, or of the whole cache when partition is
  // nullopt. Sliding items are renewed, expired ones removed.
  template <typename T>
  std::vector<CacheItem<T>>
  get_items(const std::optional<std::string> &partition = std::nullopt) {
    return collect_items<T>(partition, /*renew=*/true);
  }

  template <typename T>
  CacheResult<T> peek(const std::string &partition, const std::string &key) {
    auto item = peek_item<T>(partition, key);
    if (!item)
      return std::nullopt;
    return std::move(item->value);
  }

  template <typename T>
  CacheResult<CacheItem<T>> peek_item(const std::string &partition,
                                      const std::string &key) {
    require_peek();
    const auto id = resolve(partition, key);
    auto entry = fetch(id, /*renew=*/false);
    if (!entry)
      return std::nullopt;
    return decode_item<T>(*entry);
  }

  template <typename T>
  std::vector<CacheItem<T>>
  peek_items(const std::optional<std::string> &partition = std::nullopt) {
    require_peek();
    return collect_items<T>(partition, /*renew=*/false);
  }

  // Returns the cached value, or calls factory once and caches its result.
  // The factory runs with no engine lock held and may use this cache. Its
  // value is returned even when the following write fails, including when a
  // timed deadline passed while the factory ran.
  template <typename Factory>
  auto get_or_add(const std::string &partition, const std::string &key,
                  Factory &&factory, const ExpiryPolicy &policy,
                  const std::vector<std::string> &parent_keys = {})
      -> std::decay_t<std::invoke_result_t<Factory &>> {
    using T = std::decay_t<std::invoke_result_t<Factory &>>;
    const auto id = resolve(partition, key);
    auto parents = resolve_parents(id, parent_keys);
    check_policy(policy);
    if (auto hit = get<T>(partition, key))
      return std::move(*hit);
    T value = std::invoke(factory);
    const auto now = clock_->now();
    if (const auto stamp = expiry_after_factory(id, policy, now))
      store_value(id, std::move(parents), value, *stamp, now);
    return value;
  }

  template <typename Factory>
  auto get_or_add_sliding(const std::string &partition, const std::string &key,
                          Factory &&factory, Duration interval,
                          const std::vector<std::string> &parent_keys = {}) {
    return get_or_add(partition, key, std::forward<Factory>(factory),
                      ExpiryPolicy::sliding(interval), parent_keys);
  }

  template <typename Factory>
  auto get_or_add_static(const std::string &partition, const std::string &key,
                         Factory &&factory,
                         const std::vector<std::string> &parent_keys = {}) {
    return get_or_add(partition, key, std::forward<Factory>(factory),
                      ExpiryPolicy::fixed_static(), parent_keys);
  }

  template <typename Factory>
  auto get_or_add_timed(const std::string &partition, const std::string &key,
                        Factory &&factory, TimePoint utc_expiry,
                        const std::vector<std::string> &parent_keys = {}) {
    return get_or_add(partition, key, std::forward<Factory>(factory),
                      ExpiryPolicy::timed_at(utc_expiry), parent_keys);
  }

  template <typename Factory>
  auto get_or_add_timed(const std::string &partition, const std::string &key,
                        Factory &&factory, Duration lifetime,
                        const std::vector<std::string> &parent_keys = {}) {
    return get_or_add(partition, key, std::forward<Factory>(factory),
                      ExpiryPolicy::timed_for(lifetime), parent_keys);
  }

  // Removing a missing key is a no-op. Dependents go with the entry.
  void remove(const std::string &partition, const std::string &key);

  // IgnoreExpiry drops every entry, ConsiderExpiry only the expired ones.
  // Returns the number of matched entries.
  std::int64_t clear(ReadMode mode = ReadMode::IgnoreExpiry);
  std::int64_t clear(const std::string &partition,
                     ReadMode mode = ReadMode::IgnoreExpiry);

  int count(ReadMode mode = ReadMode::ConsiderExpiry);
  int count(const std::string &partition,
            ReadMode mode = ReadMode::ConsiderExpiry);
  std::int64_t long_count(ReadMode mode = ReadMode::ConsiderExpiry);
  std::int64_t long_count(const std::string &partition,
                          ReadMode mode = ReadMode::ConsiderExpiry);

  // True when a non-expired entry exists. Never renews or deletes.
  bool contains(const std::string &partition, const std::string &key);

  std::int64_t cache_size_bytes();

  std::optional<std::string> last_error() const;
  void clear_last_error();

private:
  struct EntryId {
    std::string partition;
    std::string key;
    std::uint64_t fingerprint{0};
  };

  struct ParentLinks {
    std::vector<std::string> keys;
    std::vector<std::uint64_t> fingerprints;
  };

  EntryId resolve(const std::string &partition, const std::string &key) const;
  ParentLinks resolve_parents(const EntryId &id,
                              const std::vector<std::string> &parent_keys) const;
  void check_policy(const ExpiryPolicy &policy) const;
  // nullopt, with the failure recorded, when the policy no longer yields a
  // live entry at `now`.
  std::optional<ExpiryStamp> expiry_after_factory(const EntryId &id,
                                                  const ExpiryPolicy &policy,
                                                  TimePoint now);
  void require_peek() const;

  void write_entry(const StoredEntry &entry);
  std::optional<StoredEntry> fetch(const EntryId &id, bool renew);
  std::vector<StoredEntry> fetch_all(const std::optional<std::string> &partition,
                                     bool renew);
  void discard_unreadable(const StoredEntry &entry, const std::exception &ex);
  void record_error(const std::string &what, const std::exception &ex);
  void maybe_auto_clean();
  std::int64_t long_count_where(const std::optional<std::string> &partition,
                                ReadMode mode);
  std::int64_t clear_where(const std::optional<std::string> &partition,
                           ReadMode mode);

  template <typename T>
  void store_value(const EntryId &id, ParentLinks parents, const T &value,
                   const ExpiryStamp &stamp, TimePoint now) {
    auto encoded = codec_.encode(value);

    StoredEntry entry;
    entry.fingerprint = id.fingerprint;
    entry.partition = id.partition;
    entry.key = id.key;
    entry.value = std::move(encoded.bytes);
    entry.compressed = encoded.compressed;
    entry.utc_creation = now;
    entry.utc_expiry = stamp.utc_expiry;
    entry.interval = stamp.interval;
    entry.parent_keys = std::move(parents.keys);
    entry.parent_fingerprints = std::move(parents.fingerprints);
    write_entry(entry);
  }

  template <typename T>
  CacheResult<CacheItem<T>> decode_item(const StoredEntry &entry) {
    try {
      CacheItem<T> item;
      item.value = codec_.decode<T>(entry.value, entry.compressed);
      item.partition = entry.partition;
      item.key = entry.key;
      item.utc_creation = entry.utc_creation;
      item.utc_expiry = entry.utc_expiry;
      item.interval = entry.interval;
      item.parent_keys = entry.parent_keys;
      return item;
    } catch (const std::exception &ex) {
      discard_unreadable(entry, ex);
      return std::nullopt;
    }
  }

  template <typename T>
  std::vector<CacheItem<T>>
  collect_items(const std::optional<std::string> &partition, bool renew) {
    std::vector<CacheItem<T>> out;
    for (const auto &entry : fetch_all(partition, renew)) {
      if (auto item = decode_item<T>(entry))
        out.push_back(std::move(*item));
    }
    return out;
  }

  CacheSettings settings_;
  std::unique_ptr<IStore> store_;
  std::shared_ptr<IClock> clock_;
  EntryCodec codec_;
  std::atomic<std::uint64_t> insertions_{0};
  mutable std::mutex error_mu_;
  std::optional<std::string> last_error_;
};

} // namespace kv_cache

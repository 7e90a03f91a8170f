#include "kv_cache/cache.hpp"

#include "kv_cache/fingerprint.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <climits>

namespace kv_cache {
namespace {
CacheSettings checked_settings(CacheSettings s) {
  std::string err;
  if (!validate_settings(s, &err))
    throw InvalidArgumentError("invalid cache settings: " + err);
  return s;
}

std::string item_name(const std::string &partition, const std::string &key) {
  return "'" + partition + "/" + key + "'";
}
} // namespace

Cache::Cache(CacheSettings settings, std::unique_ptr<IStore> store,
             std::shared_ptr<IClock> clock)
    : settings_(checked_settings(std::move(settings))),
      store_(std::move(store)), clock_(std::move(clock)),
      codec_(make_compressor_by_name(settings_.compressor),
             settings_.compression_threshold_bytes) {
  if (!store_)
    throw InvalidArgumentError("store must not be null");
  if (!clock_)
    throw InvalidArgumentError("clock must not be null");
  spdlog::debug("[Cache] ready on {} store, default partition '{}'",
                store_->name(), settings_.default_partition);
}

Cache::EntryId Cache::resolve(const std::string &partition,
                              const std::string &key) const {
  if (partition.empty())
    throw InvalidArgumentError("partition must not be empty");
  if (key.empty())
    throw InvalidArgumentError("key must not be empty");
  EntryId id;
  id.partition = truncate_utf8(partition, store_->max_partition_length());
  id.key = truncate_utf8(key, store_->max_key_length());
  id.fingerprint = fingerprint(id.partition, id.key);
  return id;
}

Cache::ParentLinks
Cache::resolve_parents(const EntryId &id,
                       const std::vector<std::string> &parent_keys) const {
  if (parent_keys.size() > store_->max_parent_keys())
    throw TooManyParentKeysError(
        "at most " + std::to_string(store_->max_parent_keys()) +
        " parent keys are allowed, got " + std::to_string(parent_keys.size()));
  ParentLinks links;
  links.keys.reserve(parent_keys.size());
  links.fingerprints.reserve(parent_keys.size());
  for (const auto &parent : parent_keys) {
    if (parent.empty())
      throw InvalidArgumentError("parent key must not be empty");
    auto truncated = truncate_utf8(parent, store_->max_key_length());
    links.fingerprints.push_back(fingerprint(id.partition, truncated));
    links.keys.push_back(std::move(truncated));
  }
  return links;
}

void Cache::check_policy(const ExpiryPolicy &policy) const {
  (void)compute_expiry(policy, clock_->now(), settings_.static_interval);
}

std::optional<ExpiryStamp>
Cache::expiry_after_factory(const EntryId &id, const ExpiryPolicy &policy,
                            TimePoint now) {
  try {
    return compute_expiry(policy, now, settings_.static_interval);
  } catch (const InvalidArgumentError &ex) {
    record_error("An error occurred while adding item " +
                     item_name(id.partition, id.key) + " to the cache",
                 ex);
    return std::nullopt;
  }
}

void Cache::require_peek() const {
  if (!store_->can_peek())
    throw NotSupportedError("the " + store_->name() +
                            " store does not support peek");
}

void Cache::write_entry(const StoredEntry &entry) {
  try {
    store_->upsert(entry);
  } catch (const std::exception &ex) {
    record_error("An error occurred while adding item " +
                     item_name(entry.partition, entry.key) + " to the cache",
                 ex);
    return;
  }
  maybe_auto_clean();
}

std::optional<StoredEntry> Cache::fetch(const EntryId &id, bool renew) {
  const auto now = clock_->now();
  try {
    auto entry = store_->read(id.fingerprint);
    if (!entry || entry->partition != id.partition || entry->key != id.key)
      return std::nullopt;
    // Follow-up writes are conditional: a concurrent add may have replaced
    // the row since it was read.
    if (is_expired(entry->utc_expiry, now)) {
      if (renew)
        store_->erase_if_expired(entry->fingerprint, now);
      return std::nullopt;
    }
    if (renew && entry->interval > Duration::zero()) {
      if (const auto next = store_->renew(entry->fingerprint, now))
        entry->utc_expiry = *next;
    }
    return entry;
  } catch (const std::exception &ex) {
    record_error("An error occurred while reading item " +
                     item_name(id.partition, id.key) + " from the cache",
                 ex);
    return std::nullopt;
  }
}

std::vector<StoredEntry>
Cache::fetch_all(const std::optional<std::string> &partition, bool renew) {
  const auto now = clock_->now();
  EntryFilter valid{partition, ReadMode::ConsiderExpiry, now, false};
  try {
    if (renew) {
      EntryFilter expired = valid;
      expired.expired_only = true;
      store_->erase_where(expired);
    }
    auto entries = store_->scan(valid);
    if (renew) {
      for (auto &entry : entries) {
        if (entry.interval <= Duration::zero())
          continue;
        if (const auto next = store_->renew(entry.fingerprint, now))
          entry.utc_expiry = *next;
      }
    }
    return entries;
  } catch (const std::exception &ex) {
    record_error(partition ? "An error occurred while reading items of '" +
                                 *partition + "' from the cache"
                           : "An error occurred while reading items from "
                             "the cache",
                 ex);
    return {};
  }
}

void Cache::discard_unreadable(const StoredEntry &entry,
                               const std::exception &ex) {
  spdlog::warn("[Cache] removing unreadable item {}: {}",
               item_name(entry.partition, entry.key), ex.what());
  {
    std::lock_guard<std::mutex> lk(error_mu_);
    last_error_ = "An error occurred while deserializing item " +
                  item_name(entry.partition, entry.key) + ": " + ex.what();
  }
  try {
    store_->erase(entry.fingerprint);
  } catch (const std::exception &erase_ex) {
    record_error("An error occurred while removing item " +
                     item_name(entry.partition, entry.key) +
                     " from the cache",
                 erase_ex);
  }
}

void Cache::record_error(const std::string &what, const std::exception &ex) {
  spdlog::error("[Cache] {}: {}", what, ex.what());
  std::lock_guard<std::mutex> lk(error_mu_);
  last_error_ = what + ": " + ex.what();
}

void Cache::maybe_auto_clean() {
  const auto every = settings_.insertions_before_auto_clean;
  if (every == 0)
    return;
  if ((insertions_.fetch_add(1, std::memory_order_relaxed) + 1) % every != 0)
    return;
  const auto removed = clear_where(std::nullopt, ReadMode::ConsiderExpiry);
  spdlog::debug("[Cache] auto clean removed {} expired items", removed);
}

void Cache::remove(const std::string &partition, const std::string &key) {
  const auto id = resolve(partition, key);
  try {
    store_->erase(id.fingerprint);
  } catch (const std::exception &ex) {
    record_error("An error occurred while removing item " +
                     item_name(id.partition, id.key) + " from the cache",
                 ex);
  }
}

std::int64_t Cache::clear_where(const std::optional<std::string> &partition,
                                ReadMode mode) {
  EntryFilter filter{partition, mode, clock_->now(),
                     mode == ReadMode::ConsiderExpiry};
  try {
    return store_->erase_where(filter);
  } catch (const std::exception &ex) {
    record_error("An error occurred while clearing the cache", ex);
    return 0;
  }
}

std::int64_t Cache::clear(ReadMode mode) {
  return clear_where(std::nullopt, mode);
}

std::int64_t Cache::clear(const std::string &partition, ReadMode mode) {
  if (partition.empty())
    throw InvalidArgumentError("partition must not be empty");
  return clear_where(truncate_utf8(partition, store_->max_partition_length()),
                     mode);
}

std::int64_t
Cache::long_count_where(const std::optional<std::string> &partition,
                        ReadMode mode) {
  EntryFilter filter{partition, mode, clock_->now(), false};
  try {
    return store_->count_where(filter);
  } catch (const std::exception &ex) {
    record_error("An error occurred while counting cache items", ex);
    return 0;
  }
}

std::int64_t Cache::long_count(ReadMode mode) {
  return long_count_where(std::nullopt, mode);
}

std::int64_t Cache::long_count(const std::string &partition, ReadMode mode) {
  if (partition.empty())
    throw InvalidArgumentError("partition must not be empty");
  return long_count_where(
      truncate_utf8(partition, store_->max_partition_length()), mode);
}

int Cache::count(ReadMode mode) {
  return static_cast<int>(std::min<std::int64_t>(long_count(mode), INT_MAX));
}

int Cache::count(const std::string &partition, ReadMode mode) {
  return static_cast<int>(
      std::min<std::int64_t>(long_count(partition, mode), INT_MAX));
}

bool Cache::contains(const std::string &partition, const std::string &key) {
  const auto id = resolve(partition, key);
  const auto now = clock_->now();
  try {
    const auto entry = store_->read(id.fingerprint);
    return entry && entry->partition == id.partition && entry->key == id.key &&
           !is_expired(entry->utc_expiry, now);
  } catch (const std::exception &ex) {
    record_error("An error occurred while checking item " +
                     item_name(id.partition, id.key),
                 ex);
    return false;
  }
}

std::int64_t Cache::cache_size_bytes() {
  try {
    return store_->size_bytes();
  } catch (const std::exception &ex) {
    record_error("An error occurred while measuring the cache size", ex);
    return 0;
  }
}

std::optional<std::string> Cache::last_error() const {
  std::lock_guard<std::mutex> lk(error_mu_);
  return last_error_;
}

void Cache::clear_last_error() {
  std::lock_guard<std::mutex> lk(error_mu_);
  last_error_.reset();
}

} // namespace kv_cache

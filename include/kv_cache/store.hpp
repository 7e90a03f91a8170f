#pragma once

#include "kv_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kv_cache {

struct CacheSettings;

// Backing table of a cache. Implementations throw StoreError on backend
// failure and must make each call atomic. Removing an entry must also remove,
// transitively, every entry that lists it as a parent.
class IStore {
public:
  virtual ~IStore() = default;

  virtual std::string name() const = 0;
  virtual bool can_peek() const = 0;
  virtual std::size_t max_partition_length() const = 0;
  virtual std::size_t max_key_length() const = 0;
  virtual std::size_t max_parent_keys() const = 0;

  // Insert or overwrite the row with entry.fingerprint. Fails when one of the
  // parent fingerprints has no row.
  virtual void upsert(const StoredEntry &entry) = 0;
  virtual std::optional<StoredEntry> read(std::uint64_t fingerprint) = 0;
  // Slides a still valid entry to now + its interval. Returns the new
  // expiry, or nullopt when the row is gone, expired or timed.
  virtual std::optional<TimePoint> renew(std::uint64_t fingerprint,
                                         TimePoint now) = 0;
  virtual bool erase(std::uint64_t fingerprint) = 0;
  // Removes the row only if it is expired at `now`.
  virtual bool erase_if_expired(std::uint64_t fingerprint, TimePoint now) = 0;
  // Returns how many rows matched the filter, cascaded rows excluded.
  virtual std::int64_t erase_where(const EntryFilter &filter) = 0;
  virtual std::vector<StoredEntry> scan(const EntryFilter &filter) = 0;
  virtual std::int64_t count_where(const EntryFilter &filter) = 0;
  // Approximate, sum of stored value sizes.
  virtual std::int64_t size_bytes() = 0;
};

std::unique_ptr<IStore> make_store_by_name(const std::string &name,
                                           const CacheSettings &settings);

} // namespace kv_cache

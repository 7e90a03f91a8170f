#pragma once

#include "kv_cache/store.hpp"

#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace kv_cache {

struct MemoryStoreConfig {
  std::size_t max_partition_length{2000};
  std::size_t max_key_length{2000};
  std::size_t max_parent_keys{5};
  bool can_peek{true};
};

// Process-local store. One mutex guards the table, so every call is a
// transaction.
class MemoryStore final : public IStore {
public:
  explicit MemoryStore(MemoryStoreConfig cfg = {});

  std::string name() const override { return "memory"; }
  bool can_peek() const override { return cfg_.can_peek; }
  std::size_t max_partition_length() const override {
    return cfg_.max_partition_length;
  }
  std::size_t max_key_length() const override { return cfg_.max_key_length; }
  std::size_t max_parent_keys() const override { return cfg_.max_parent_keys; }

  void upsert(const StoredEntry &entry) override;
  std::optional<StoredEntry> read(std::uint64_t fingerprint) override;
  std::optional<TimePoint> renew(std::uint64_t fingerprint,
                                 TimePoint now) override;
  bool erase(std::uint64_t fingerprint) override;
  bool erase_if_expired(std::uint64_t fingerprint, TimePoint now) override;
  std::int64_t erase_where(const EntryFilter &filter) override;
  std::vector<StoredEntry> scan(const EntryFilter &filter) override;
  std::int64_t count_where(const EntryFilter &filter) override;
  std::int64_t size_bytes() override;

private:
  void erase_locked(std::uint64_t fingerprint);
  void unlink_parents(const StoredEntry &entry);

  MemoryStoreConfig cfg_;
  std::mutex mu_;
  std::unordered_map<std::uint64_t, StoredEntry> entries_;
  // parent fingerprint -> fingerprints of entries depending on it
  std::unordered_map<std::uint64_t, std::unordered_set<std::uint64_t>>
      children_;
  std::size_t bytes_{0};
};

} // namespace kv_cache

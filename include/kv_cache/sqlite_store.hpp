#pragma once

#include "kv_cache/store.hpp"

#include <memory>
#include <mutex>
#include <string>

struct sqlite3;

namespace kv_cache {

struct SqliteStoreConfig {
  // ":memory:" for a volatile store, a file path for a persistent one.
  std::string path{":memory:"};
  std::size_t max_cache_size_mb{1024};
  int busy_timeout_ms{5000};
  std::size_t max_partition_length{2000};
  std::size_t max_key_length{2000};
};

// Store backed by one SQLite table. Parent links are foreign keys with
// ON DELETE CASCADE, overwrites use INSERT ... ON CONFLICT DO UPDATE.
class SqliteStore final : public IStore {
public:
  static constexpr std::size_t kMaxParentKeys = 5;

  // Opens the database and creates the schema. Throws StoreError.
  explicit SqliteStore(SqliteStoreConfig cfg);
  ~SqliteStore() override;
  SqliteStore(const SqliteStore &) = delete;
  SqliteStore &operator=(const SqliteStore &) = delete;

  std::string name() const override {
    return cfg_.path == ":memory:" ? "volatile" : "persistent";
  }
  bool can_peek() const override { return true; }
  std::size_t max_partition_length() const override {
    return cfg_.max_partition_length;
  }
  std::size_t max_key_length() const override { return cfg_.max_key_length; }
  std::size_t max_parent_keys() const override { return kMaxParentKeys; }

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

  // Rebuilds the database file. Not allowed inside a transaction.
  void vacuum();

  const SqliteStoreConfig &config() const { return cfg_; }

private:
  class Statement;

  void exec(const std::string &sql);
  Statement prepare(const std::string &sql);
  void configure();
  void ensure_schema();
  [[noreturn]] void fail(const std::string &what) const;

  SqliteStoreConfig cfg_;
  sqlite3 *db_{nullptr};
  std::mutex mu_;
};

} // namespace kv_cache

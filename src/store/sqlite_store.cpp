#include "kv_cache/sqlite_store.hpp"

#include "kv_cache/errors.hpp"

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <algorithm>
#include <utility>

namespace kv_cache {
namespace {
constexpr int kParentSlots = static_cast<int>(SqliteStore::kMaxParentKeys);

const char kSchema[] = R"(
CREATE TABLE IF NOT EXISTS cache_entries (
  hash         INTEGER PRIMARY KEY NOT NULL,
  part         TEXT NOT NULL,
  entry_key    TEXT NOT NULL,
  value        BLOB NOT NULL,
  compressed   INTEGER NOT NULL,
  utc_creation INTEGER NOT NULL,
  utc_expiry   INTEGER NOT NULL,
  interval_ms  INTEGER NOT NULL,
  parent_hash0 INTEGER, parent_key0 TEXT,
  parent_hash1 INTEGER, parent_key1 TEXT,
  parent_hash2 INTEGER, parent_key2 TEXT,
  parent_hash3 INTEGER, parent_key3 TEXT,
  parent_hash4 INTEGER, parent_key4 TEXT,
  FOREIGN KEY (parent_hash0) REFERENCES cache_entries (hash) ON DELETE CASCADE,
  FOREIGN KEY (parent_hash1) REFERENCES cache_entries (hash) ON DELETE CASCADE,
  FOREIGN KEY (parent_hash2) REFERENCES cache_entries (hash) ON DELETE CASCADE,
  FOREIGN KEY (parent_hash3) REFERENCES cache_entries (hash) ON DELETE CASCADE,
  FOREIGN KEY (parent_hash4) REFERENCES cache_entries (hash) ON DELETE CASCADE
);
CREATE INDEX IF NOT EXISTS ix_cache_part_expiry ON cache_entries (part, utc_expiry);
CREATE INDEX IF NOT EXISTS ix_cache_parent0 ON cache_entries (parent_hash0);
CREATE INDEX IF NOT EXISTS ix_cache_parent1 ON cache_entries (parent_hash1);
CREATE INDEX IF NOT EXISTS ix_cache_parent2 ON cache_entries (parent_hash2);
CREATE INDEX IF NOT EXISTS ix_cache_parent3 ON cache_entries (parent_hash3);
CREATE INDEX IF NOT EXISTS ix_cache_parent4 ON cache_entries (parent_hash4);
)";

const char kSelect[] =
    "SELECT hash, part, entry_key, value, compressed, utc_creation, "
    "utc_expiry, interval_ms, parent_hash0, parent_key0, parent_hash1, "
    "parent_key1, parent_hash2, parent_key2, parent_hash3, parent_key3, "
    "parent_hash4, parent_key4 FROM cache_entries";

const char kUpsert[] =
    "INSERT INTO cache_entries (hash, part, entry_key, value, compressed, "
    "utc_creation, utc_expiry, interval_ms, parent_hash0, parent_key0, "
    "parent_hash1, parent_key1, parent_hash2, parent_key2, parent_hash3, "
    "parent_key3, parent_hash4, parent_key4) "
    "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, "
    "?15, ?16, ?17, ?18) "
    "ON CONFLICT (hash) DO UPDATE SET part = excluded.part, "
    "entry_key = excluded.entry_key, value = excluded.value, "
    "compressed = excluded.compressed, utc_creation = excluded.utc_creation, "
    "utc_expiry = excluded.utc_expiry, interval_ms = excluded.interval_ms, "
    "parent_hash0 = excluded.parent_hash0, parent_key0 = excluded.parent_key0, "
    "parent_hash1 = excluded.parent_hash1, parent_key1 = excluded.parent_key1, "
    "parent_hash2 = excluded.parent_hash2, parent_key2 = excluded.parent_key2, "
    "parent_hash3 = excluded.parent_hash3, parent_key3 = excluded.parent_key3, "
    "parent_hash4 = excluded.parent_hash4, parent_key4 = excluded.parent_key4";

// ?1 is the partition, ?2 the reference instant.
std::string where_clause(const EntryFilter &f) {
  std::string sql;
  auto add = [&sql](const char *cond) {
    sql += sql.empty() ? " WHERE " : " AND ";
    sql += cond;
  };
  if (f.partition)
    add("part = ?1");
  if (f.mode == ReadMode::ConsiderExpiry)
    add(f.expired_only ? "utc_expiry < ?2" : "utc_expiry >= ?2");
  return sql;
}

std::int64_t as_row_id(std::uint64_t fingerprint) {
  return static_cast<std::int64_t>(fingerprint);
}
} // namespace

class SqliteStore::Statement {
public:
  Statement(const SqliteStore &owner, sqlite3_stmt *stmt)
      : owner_(&owner), stmt_(stmt) {}
  ~Statement() { sqlite3_finalize(stmt_); }
  Statement(Statement &&other) noexcept
      : owner_(other.owner_), stmt_(std::exchange(other.stmt_, nullptr)) {}
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;
  Statement &operator=(Statement &&) = delete;

  void bind(int index, std::int64_t v) {
    check(sqlite3_bind_int64(stmt_, index, v), "bind");
  }
  void bind(int index, const std::string &v) {
    check(sqlite3_bind_text(stmt_, index, v.data(), static_cast<int>(v.size()),
                            SQLITE_TRANSIENT),
          "bind");
  }
  void bind(int index, const std::vector<std::uint8_t> &v) {
    static const std::uint8_t empty = 0;
    check(sqlite3_bind_blob(stmt_, index, v.empty() ? &empty : v.data(),
                            static_cast<int>(v.size()), SQLITE_TRANSIENT),
          "bind");
  }
  void bind_null(int index) { check(sqlite3_bind_null(stmt_, index), "bind"); }

  void bind_filter(const EntryFilter &f) {
    if (f.partition)
      bind(1, *f.partition);
    if (f.mode == ReadMode::ConsiderExpiry)
      bind(2, to_epoch_ms(f.now));
  }

  // True while rows are available.
  bool step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW)
      return true;
    if (rc == SQLITE_DONE)
      return false;
    owner_->fail("step");
  }

  std::int64_t column_int64(int i) const {
    return sqlite3_column_int64(stmt_, i);
  }
  bool column_is_null(int i) const {
    return sqlite3_column_type(stmt_, i) == SQLITE_NULL;
  }
  std::string column_text(int i) const {
    const auto *p = sqlite3_column_text(stmt_, i);
    const int n = sqlite3_column_bytes(stmt_, i);
    return p ? std::string(reinterpret_cast<const char *>(p), n) : std::string();
  }
  std::vector<std::uint8_t> column_blob(int i) const {
    const auto *p = static_cast<const std::uint8_t *>(sqlite3_column_blob(stmt_, i));
    const int n = sqlite3_column_bytes(stmt_, i);
    return p ? std::vector<std::uint8_t>(p, p + n) : std::vector<std::uint8_t>();
  }

  // Current row of a kSelect query.
  StoredEntry entry() const {
    StoredEntry e;
    e.fingerprint = static_cast<std::uint64_t>(column_int64(0));
    e.partition = column_text(1);
    e.key = column_text(2);
    e.value = column_blob(3);
    e.compressed = column_int64(4) != 0;
    e.utc_creation = from_epoch_ms(column_int64(5));
    e.utc_expiry = from_epoch_ms(column_int64(6));
    e.interval = Duration(column_int64(7));
    for (int slot = 0; slot < kParentSlots; ++slot) {
      const int col = 8 + slot * 2;
      if (column_is_null(col))
        continue;
      e.parent_fingerprints.push_back(
          static_cast<std::uint64_t>(column_int64(col)));
      e.parent_keys.push_back(column_text(col + 1));
    }
    return e;
  }

private:
  void check(int rc, const char *what) const {
    if (rc != SQLITE_OK)
      owner_->fail(what);
  }

  const SqliteStore *owner_;
  sqlite3_stmt *stmt_;
};

SqliteStore::SqliteStore(SqliteStoreConfig cfg) : cfg_(std::move(cfg)) {
  const int flags =
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  sqlite3 *handle = nullptr;
  if (sqlite3_open_v2(cfg_.path.c_str(), &handle, flags, nullptr) !=
      SQLITE_OK) {
    std::string msg = "failed to open SQLite database '" + cfg_.path + "'";
    if (handle) {
      msg += ": ";
      msg += sqlite3_errmsg(handle);
      sqlite3_close(handle);
    }
    throw StoreError(msg);
  }
  db_ = handle;
  try {
    configure();
    ensure_schema();
  } catch (const StoreError &) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  spdlog::info("[SqliteStore] opened {} database '{}'", name(), cfg_.path);
}

SqliteStore::~SqliteStore() { sqlite3_close(db_); }

void SqliteStore::fail(const std::string &what) const {
  throw StoreError("SQLite " + what + " failed: " + sqlite3_errmsg(db_));
}

void SqliteStore::exec(const std::string &sql) {
  char *err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) == SQLITE_OK)
    return;
  std::string msg = err ? err : sqlite3_errmsg(db_);
  sqlite3_free(err);
  throw StoreError("SQLite exec failed: " + msg);
}

SqliteStore::Statement SqliteStore::prepare(const std::string &sql) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()) + 1,
                         &stmt, nullptr) != SQLITE_OK)
    fail("prepare");
  return Statement(*this, stmt);
}

void SqliteStore::configure() {
  sqlite3_busy_timeout(db_, cfg_.busy_timeout_ms);
  exec("PRAGMA foreign_keys = ON");
  if (cfg_.path != ":memory:")
    exec("PRAGMA journal_mode = WAL");

  auto stmt = prepare("PRAGMA page_size");
  std::int64_t page_size = 4096;
  if (stmt.step())
    page_size = stmt.column_int64(0);
  const std::int64_t max_pages =
      static_cast<std::int64_t>(cfg_.max_cache_size_mb) * 1024 * 1024 /
      std::max<std::int64_t>(page_size, 512);
  exec("PRAGMA max_page_count = " + std::to_string(max_pages));
}

void SqliteStore::ensure_schema() {
  exec(kSchema);
  spdlog::debug("[SqliteStore] schema ready");
}

void SqliteStore::upsert(const StoredEntry &entry) {
  std::lock_guard<std::mutex> lk(mu_);
  auto stmt = prepare(kUpsert);
  stmt.bind(1, as_row_id(entry.fingerprint));
  stmt.bind(2, entry.partition);
  stmt.bind(3, entry.key);
  stmt.bind(4, entry.value);
  stmt.bind(5, static_cast<std::int64_t>(entry.compressed ? 1 : 0));
  stmt.bind(6, to_epoch_ms(entry.utc_creation));
  stmt.bind(7, to_epoch_ms(entry.utc_expiry));
  stmt.bind(8, static_cast<std::int64_t>(entry.interval.count()));
  for (int slot = 0; slot < kParentSlots; ++slot) {
    const int index = 9 + slot * 2;
    if (static_cast<std::size_t>(slot) < entry.parent_fingerprints.size()) {
      stmt.bind(index, as_row_id(entry.parent_fingerprints[slot]));
      stmt.bind(index + 1, entry.parent_keys[slot]);
    } else {
      stmt.bind_null(index);
      stmt.bind_null(index + 1);
    }
  }
  stmt.step();
}

std::optional<StoredEntry> SqliteStore::read(std::uint64_t fingerprint) {
  std::lock_guard<std::mutex> lk(mu_);
  auto stmt = prepare(std::string(kSelect) + " WHERE hash = ?1");
  stmt.bind(1, as_row_id(fingerprint));
  if (!stmt.step())
    return std::nullopt;
  return stmt.entry();
}

std::optional<TimePoint> SqliteStore::renew(std::uint64_t fingerprint,
                                            TimePoint now) {
  std::lock_guard<std::mutex> lk(mu_);
  auto stmt = prepare(
      "UPDATE cache_entries SET utc_expiry = ?2 + interval_ms "
      "WHERE hash = ?1 AND interval_ms > 0 AND utc_expiry >= ?2 "
      "RETURNING utc_expiry");
  stmt.bind(1, as_row_id(fingerprint));
  stmt.bind(2, to_epoch_ms(now));
  // RETURNING applies the whole update on the first step.
  if (!stmt.step())
    return std::nullopt;
  return from_epoch_ms(stmt.column_int64(0));
}

bool SqliteStore::erase(std::uint64_t fingerprint) {
  std::lock_guard<std::mutex> lk(mu_);
  auto stmt = prepare("DELETE FROM cache_entries WHERE hash = ?1");
  stmt.bind(1, as_row_id(fingerprint));
  stmt.step();
  return sqlite3_changes(db_) > 0;
}

bool SqliteStore::erase_if_expired(std::uint64_t fingerprint, TimePoint now) {
  std::lock_guard<std::mutex> lk(mu_);
  auto stmt =
      prepare("DELETE FROM cache_entries WHERE hash = ?1 AND utc_expiry < ?2");
  stmt.bind(1, as_row_id(fingerprint));
  stmt.bind(2, to_epoch_ms(now));
  stmt.step();
  return sqlite3_changes(db_) > 0;
}

std::int64_t SqliteStore::erase_where(const EntryFilter &filter) {
  std::lock_guard<std::mutex> lk(mu_);
  auto stmt = prepare("DELETE FROM cache_entries" + where_clause(filter));
  stmt.bind_filter(filter);
  stmt.step();
  // foreign key actions are not counted by sqlite3_changes
  return sqlite3_changes(db_);
}

std::vector<StoredEntry> SqliteStore::scan(const EntryFilter &filter) {
  std::lock_guard<std::mutex> lk(mu_);
  auto stmt = prepare(std::string(kSelect) + where_clause(filter) +
                      " ORDER BY part, entry_key");
  stmt.bind_filter(filter);
  std::vector<StoredEntry> out;
  while (stmt.step())
    out.push_back(stmt.entry());
  return out;
}

std::int64_t SqliteStore::count_where(const EntryFilter &filter) {
  std::lock_guard<std::mutex> lk(mu_);
  auto stmt =
      prepare("SELECT COUNT(*) FROM cache_entries" + where_clause(filter));
  stmt.bind_filter(filter);
  return stmt.step() ? stmt.column_int64(0) : 0;
}

std::int64_t SqliteStore::size_bytes() {
  std::lock_guard<std::mutex> lk(mu_);
  auto stmt =
      prepare("SELECT COALESCE(SUM(LENGTH(value)), 0) FROM cache_entries");
  return stmt.step() ? stmt.column_int64(0) : 0;
}

void SqliteStore::vacuum() {
  std::lock_guard<std::mutex> lk(mu_);
  exec("VACUUM");
  spdlog::info("[SqliteStore] vacuumed '{}'", cfg_.path);
}

} // namespace kv_cache

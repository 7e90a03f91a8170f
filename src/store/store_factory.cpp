#include "kv_cache/store.hpp"

#include "kv_cache/errors.hpp"
#include "kv_cache/memory_store.hpp"
#include "kv_cache/settings.hpp"
#include "kv_cache/sqlite_store.hpp"

namespace kv_cache {

std::unique_ptr<IStore> make_store_by_name(const std::string &name,
                                           const CacheSettings &settings) {
  if (name == "memory")
    return std::make_unique<MemoryStore>();

  SqliteStoreConfig cfg;
  cfg.max_cache_size_mb = settings.max_cache_size_mb;
  cfg.busy_timeout_ms = settings.busy_timeout_ms;
  if (name == "volatile") {
    cfg.path = ":memory:";
    return std::make_unique<SqliteStore>(cfg);
  }
  if (name == "persistent") {
    cfg.path = settings.cache_file;
    return std::make_unique<SqliteStore>(cfg);
  }
  throw InvalidArgumentError("unknown store '" + name + "'");
}

} // namespace kv_cache

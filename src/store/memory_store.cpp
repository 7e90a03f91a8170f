#include "kv_cache/memory_store.hpp"

#include "kv_cache/errors.hpp"
#include "kv_cache/expiry.hpp"

#include <algorithm>

namespace kv_cache {

MemoryStore::MemoryStore(MemoryStoreConfig cfg) : cfg_(cfg) {}

void MemoryStore::upsert(const StoredEntry &entry) {
  std::lock_guard<std::mutex> lk(mu_);
  for (std::size_t i = 0; i < entry.parent_fingerprints.size(); ++i) {
    if (!entries_.contains(entry.parent_fingerprints[i]))
      throw StoreError("parent item '" + entry.partition + "/" +
                       entry.parent_keys[i] + "' does not exist");
  }

  auto it = entries_.find(entry.fingerprint);
  if (it != entries_.end()) {
    unlink_parents(it->second);
    bytes_ -= it->second.value.size();
    it->second = entry;
  } else {
    it = entries_.emplace(entry.fingerprint, entry).first;
  }
  bytes_ += entry.value.size();
  for (const auto parent : entry.parent_fingerprints)
    children_[parent].insert(entry.fingerprint);
}

std::optional<StoredEntry> MemoryStore::read(std::uint64_t fingerprint) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(fingerprint);
  if (it == entries_.end())
    return std::nullopt;
  return it->second;
}

std::optional<TimePoint> MemoryStore::renew(std::uint64_t fingerprint,
                                            TimePoint now) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(fingerprint);
  if (it == entries_.end() || is_expired(it->second.utc_expiry, now))
    return std::nullopt;
  const auto next = renewed_expiry(it->second.interval, now);
  if (next)
    it->second.utc_expiry = *next;
  return next;
}

bool MemoryStore::erase(std::uint64_t fingerprint) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!entries_.contains(fingerprint))
    return false;
  erase_locked(fingerprint);
  return true;
}

bool MemoryStore::erase_if_expired(std::uint64_t fingerprint, TimePoint now) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(fingerprint);
  if (it == entries_.end() || !is_expired(it->second.utc_expiry, now))
    return false;
  erase_locked(fingerprint);
  return true;
}

std::int64_t MemoryStore::erase_where(const EntryFilter &filter) {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::uint64_t> matched;
  for (const auto &[fp, e] : entries_) {
    if (filter.matches(e))
      matched.push_back(fp);
  }
  for (const auto fp : matched)
    erase_locked(fp);
  return static_cast<std::int64_t>(matched.size());
}

std::vector<StoredEntry> MemoryStore::scan(const EntryFilter &filter) {
  std::vector<StoredEntry> out;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto &[fp, e] : entries_) {
      if (filter.matches(e))
        out.push_back(e);
    }
  }
  std::sort(out.begin(), out.end(),
            [](const StoredEntry &a, const StoredEntry &b) {
              if (a.partition != b.partition)
                return a.partition < b.partition;
              return a.key < b.key;
            });
  return out;
}

std::int64_t MemoryStore::count_where(const EntryFilter &filter) {
  std::lock_guard<std::mutex> lk(mu_);
  return static_cast<std::int64_t>(
      std::count_if(entries_.begin(), entries_.end(),
                    [&](const auto &kv) { return filter.matches(kv.second); }));
}

std::int64_t MemoryStore::size_bytes() {
  std::lock_guard<std::mutex> lk(mu_);
  return static_cast<std::int64_t>(bytes_);
}

void MemoryStore::erase_locked(std::uint64_t fingerprint) {
  std::vector<std::uint64_t> pending{fingerprint};
  while (!pending.empty()) {
    const auto fp = pending.back();
    pending.pop_back();
    auto it = entries_.find(fp);
    if (it == entries_.end())
      continue;
    unlink_parents(it->second);
    bytes_ -= it->second.value.size();
    entries_.erase(it);

    auto deps = children_.find(fp);
    if (deps == children_.end())
      continue;
    pending.insert(pending.end(), deps->second.begin(), deps->second.end());
    children_.erase(deps);
  }
}

void MemoryStore::unlink_parents(const StoredEntry &entry) {
  for (const auto parent : entry.parent_fingerprints) {
    auto it = children_.find(parent);
    if (it == children_.end())
      continue;
    it->second.erase(entry.fingerprint);
    if (it->second.empty())
      children_.erase(it);
  }
}

} // namespace kv_cache

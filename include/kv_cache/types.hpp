#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kv_cache {

using Duration = std::chrono::milliseconds;
using TimePoint =
    std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

template <typename T> using CacheResult = std::optional<T>;

enum class ReadMode { ConsiderExpiry, IgnoreExpiry };

// One row of the backing table. value holds serialized (and possibly
// compressed) bytes.
struct StoredEntry {
  std::uint64_t fingerprint{0};
  std::string partition;
  std::string key;
  std::vector<std::uint8_t> value;
  bool compressed{false};
  TimePoint utc_creation{};
  TimePoint utc_expiry{};
  Duration interval{0};
  std::vector<std::string> parent_keys;
  std::vector<std::uint64_t> parent_fingerprints;
};

template <typename T> struct CacheItem {
  std::string partition;
  std::string key;
  T value{};
  TimePoint utc_creation{};
  TimePoint utc_expiry{};
  Duration interval{0};
  std::vector<std::string> parent_keys;
};

struct EntryFilter {
  std::optional<std::string> partition;
  ReadMode mode{ReadMode::ConsiderExpiry};
  TimePoint now{};
  // With ConsiderExpiry, selects expired entries instead of valid ones.
  bool expired_only{false};

  bool matches(const StoredEntry &e) const {
    if (partition.has_value() && e.partition != *partition)
      return false;
    if (mode == ReadMode::IgnoreExpiry)
      return true;
    const bool expired = e.utc_expiry < now;
    return expired_only ? expired : !expired;
  }
};

inline std::int64_t to_epoch_ms(TimePoint t) {
  return static_cast<std::int64_t>(t.time_since_epoch().count());
}

inline TimePoint from_epoch_ms(std::int64_t ms) {
  return TimePoint(Duration(ms));
}

} // namespace kv_cache

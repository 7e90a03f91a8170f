#pragma once

#include "kv_cache/types.hpp"

#include <optional>

namespace kv_cache {

enum class ExpiryKind { Sliding, Static, TimedAt, TimedFor };

struct ExpiryPolicy {
  ExpiryKind kind{ExpiryKind::Static};
  Duration span{0};
  TimePoint at{};

  static ExpiryPolicy sliding(Duration interval);
  static ExpiryPolicy fixed_static();
  static ExpiryPolicy timed_at(TimePoint utc_expiry);
  static ExpiryPolicy timed_for(Duration lifetime);
};

struct ExpiryStamp {
  TimePoint utc_expiry{};
  // Zero for timed entries, the renewal span otherwise.
  Duration interval{0};
};

// Throws InvalidArgumentError when the policy would produce an entry that
// is already expired or a non-positive sliding interval.
ExpiryStamp compute_expiry(const ExpiryPolicy &policy, TimePoint now,
                           Duration static_interval);

// Expiry boundary is inclusive of now.
inline bool is_expired(TimePoint utc_expiry, TimePoint now) {
  return utc_expiry < now;
}

// New expiry for a read at `now`, or nullopt when the entry does not renew.
std::optional<TimePoint> renewed_expiry(Duration interval, TimePoint now);

} // namespace kv_cache

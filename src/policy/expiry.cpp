#include "kv_cache/expiry.hpp"

#include "kv_cache/errors.hpp"

namespace kv_cache {

ExpiryPolicy ExpiryPolicy::sliding(Duration interval) {
  return ExpiryPolicy{ExpiryKind::Sliding, interval, TimePoint{}};
}

ExpiryPolicy ExpiryPolicy::fixed_static() {
  return ExpiryPolicy{ExpiryKind::Static, Duration{0}, TimePoint{}};
}

ExpiryPolicy ExpiryPolicy::timed_at(TimePoint utc_expiry) {
  return ExpiryPolicy{ExpiryKind::TimedAt, Duration{0}, utc_expiry};
}

ExpiryPolicy ExpiryPolicy::timed_for(Duration lifetime) {
  return ExpiryPolicy{ExpiryKind::TimedFor, lifetime, TimePoint{}};
}

ExpiryStamp compute_expiry(const ExpiryPolicy &policy, TimePoint now,
                           Duration static_interval) {
  switch (policy.kind) {
  case ExpiryKind::Sliding:
    if (policy.span <= Duration::zero())
      throw InvalidArgumentError("sliding interval must be positive");
    return {now + policy.span, policy.span};
  case ExpiryKind::Static:
    if (static_interval <= Duration::zero())
      throw InvalidArgumentError("static interval must be positive");
    return {now + static_interval, static_interval};
  case ExpiryKind::TimedAt:
    if (is_expired(policy.at, now))
      throw InvalidArgumentError("absolute expiry is in the past");
    return {policy.at, Duration{0}};
  case ExpiryKind::TimedFor:
    if (policy.span < Duration::zero())
      throw InvalidArgumentError("lifetime must not be negative");
    return {now + policy.span, Duration{0}};
  }
  throw InvalidArgumentError("unknown expiry kind");
}

std::optional<TimePoint> renewed_expiry(Duration interval, TimePoint now) {
  if (interval <= Duration::zero())
    return std::nullopt;
  return now + interval;
}

} // namespace kv_cache

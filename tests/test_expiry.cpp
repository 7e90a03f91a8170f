#include "kv_cache/errors.hpp"
#include "kv_cache/expiry.hpp"

#include <catch2/catch.hpp>

using namespace kv_cache;
using namespace std::chrono_literals;

namespace {
const TimePoint kNow = from_epoch_ms(1700000000000);
const Duration kStatic = std::chrono::hours(24 * 30);
} // namespace

TEST_CASE("sliding and static stamps carry their renewal interval",
          "[expiry]") {
  const auto sliding = compute_expiry(ExpiryPolicy::sliding(10min), kNow, kStatic);
  CHECK(sliding.utc_expiry == kNow + 10min);
  CHECK(sliding.interval == 10min);

  const auto fixed = compute_expiry(ExpiryPolicy::fixed_static(), kNow, kStatic);
  CHECK(fixed.utc_expiry == kNow + kStatic);
  CHECK(fixed.interval == kStatic);
}

TEST_CASE("timed stamps never renew", "[expiry]") {
  const auto at = compute_expiry(ExpiryPolicy::timed_at(kNow + 1h), kNow, kStatic);
  CHECK(at.utc_expiry == kNow + 1h);
  CHECK(at.interval == Duration::zero());

  const auto lifetime =
      compute_expiry(ExpiryPolicy::timed_for(30s), kNow, kStatic);
  CHECK(lifetime.utc_expiry == kNow + 30s);
  CHECK(lifetime.interval == Duration::zero());

  CHECK_FALSE(renewed_expiry(at.interval, kNow + 5min).has_value());
  CHECK(renewed_expiry(10min, kNow + 5min) == kNow + 15min);
}

TEST_CASE("policies that cannot produce a live entry are refused",
          "[expiry]") {
  CHECK_THROWS_AS(compute_expiry(ExpiryPolicy::sliding(0ms), kNow, kStatic),
                  InvalidArgumentError);
  CHECK_THROWS_AS(compute_expiry(ExpiryPolicy::sliding(-5s), kNow, kStatic),
                  InvalidArgumentError);
  CHECK_THROWS_AS(
      compute_expiry(ExpiryPolicy::timed_at(kNow - 1ms), kNow, kStatic),
      InvalidArgumentError);
  CHECK_THROWS_AS(compute_expiry(ExpiryPolicy::timed_for(-1ms), kNow, kStatic),
                  InvalidArgumentError);
  CHECK_THROWS_AS(
      compute_expiry(ExpiryPolicy::fixed_static(), kNow, Duration::zero()),
      InvalidArgumentError);

  CHECK_NOTHROW(compute_expiry(ExpiryPolicy::timed_at(kNow), kNow, kStatic));
  CHECK_NOTHROW(compute_expiry(ExpiryPolicy::timed_for(0ms), kNow, kStatic));
}

TEST_CASE("expiry boundary includes now", "[expiry]") {
  CHECK_FALSE(is_expired(kNow, kNow));
  CHECK_FALSE(is_expired(kNow + 1ms, kNow));
  CHECK(is_expired(kNow - 1ms, kNow));
}

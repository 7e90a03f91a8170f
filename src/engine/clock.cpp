#include "kv_cache/clock.hpp"

#include <chrono>

namespace kv_cache {

TimePoint SystemClock::now() const {
  return std::chrono::time_point_cast<Duration>(
      std::chrono::system_clock::now());
}

ManualClock::ManualClock(TimePoint start) : now_ms_(to_epoch_ms(start)) {}

TimePoint ManualClock::now() const {
  return from_epoch_ms(now_ms_.load(std::memory_order_acquire));
}

void ManualClock::set(TimePoint t) {
  now_ms_.store(to_epoch_ms(t), std::memory_order_release);
}

void ManualClock::advance(Duration d) {
  now_ms_.fetch_add(d.count(), std::memory_order_acq_rel);
}

} // namespace kv_cache

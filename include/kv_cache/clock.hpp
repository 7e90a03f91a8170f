#pragma once

#include "kv_cache/types.hpp"

#include <atomic>

namespace kv_cache {

class IClock {
public:
  virtual ~IClock() = default;
  virtual TimePoint now() const = 0;
};

class SystemClock final : public IClock {
public:
  TimePoint now() const override;
};

// Clock that only moves when told to. Thread safe.
class ManualClock final : public IClock {
public:
  explicit ManualClock(TimePoint start);

  TimePoint now() const override;
  void set(TimePoint t);
  void advance(Duration d);

private:
  std::atomic<std::int64_t> now_ms_;
};

} // namespace kv_cache

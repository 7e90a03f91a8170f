#pragma once

#include "kv_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace kv_cache {

struct CacheSettings {
  std::string default_partition{"kv_cache.default"};
  Duration static_interval{std::chrono::hours(24 * 30)};
  std::uint64_t insertions_before_auto_clean{256};
  std::size_t max_cache_size_mb{1024};
  std::size_t compression_threshold_bytes{4096};
  std::string compressor{"zlib"};
  std::string store{"memory"};
  std::string cache_file{"kv_cache.sqlite"};
  int busy_timeout_ms{5000};
};

bool validate_settings(const CacheSettings &s, std::string *err = nullptr);

// Reads a flat JSON object whose keys mirror CacheSettings
// (static_interval_days for the static interval). Unknown keys are ignored,
// numbers are clamped. On failure `out` is left untouched.
bool load_settings(const std::string &path, CacheSettings &out,
                   std::string *err = nullptr);

} // namespace kv_cache

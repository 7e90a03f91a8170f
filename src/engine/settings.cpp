#include "kv_cache/settings.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>

namespace kv_cache {
namespace {
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
std::uint64_t clamp_u64(std::uint64_t v, std::uint64_t lo, std::uint64_t hi) {
  return std::clamp(v, lo, hi);
}
} // namespace

bool validate_settings(const CacheSettings &s, std::string *err) {
  auto fail = [err](const char *msg) {
    if (err)
      *err = msg;
    return false;
  };
  if (s.default_partition.empty())
    return fail("default_partition must not be empty");
  if (s.static_interval <= Duration::zero())
    return fail("static_interval must be positive");
  if (s.max_cache_size_mb == 0)
    return fail("max_cache_size_mb must be positive");
  if (s.compressor != "zlib" && s.compressor != "none")
    return fail("unknown compressor");
  if (s.store != "memory" && s.store != "volatile" && s.store != "persistent")
    return fail("unknown store");
  if (s.store == "persistent" && s.cache_file.empty())
    return fail("persistent store needs cache_file");
  if (s.busy_timeout_ms < 0)
    return fail("busy_timeout_ms must not be negative");
  return true;
}

bool load_settings(const std::string &path, CacheSettings &out,
                   std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "settings file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  CacheSettings s = out;
  std::uint64_t u;
  std::string str;
  try {
    if (extract_string(text, "default_partition", str))
      s.default_partition = str;
    if (extract_u64(text, "static_interval_days", u))
      s.static_interval =
          std::chrono::hours(24 * static_cast<std::int64_t>(
                                      clamp_u64(u, 1, 3650)));
    if (extract_u64(text, "insertions_before_auto_clean", u))
      s.insertions_before_auto_clean = clamp_u64(u, 0, 1000000000);
    if (extract_u64(text, "max_cache_size_mb", u))
      s.max_cache_size_mb =
          static_cast<std::size_t>(clamp_u64(u, 1, 1024 * 1024));
    if (extract_u64(text, "compression_threshold_bytes", u))
      s.compression_threshold_bytes =
          static_cast<std::size_t>(clamp_u64(u, 0, 1ULL << 30));
    if (extract_string(text, "compressor", str))
      s.compressor = str;
    if (extract_string(text, "store", str))
      s.store = str;
    if (extract_string(text, "cache_file", str))
      s.cache_file = str;
    if (extract_u64(text, "busy_timeout_ms", u))
      s.busy_timeout_ms = static_cast<int>(clamp_u64(u, 0, 600000));
  } catch (const std::out_of_range &) {
    if (err)
      *err = "number out of range";
    return false;
  }

  if (!validate_settings(s, err))
    return false;
  out = std::move(s);
  return true;
}

} // namespace kv_cache

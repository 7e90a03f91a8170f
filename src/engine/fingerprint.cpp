#include "kv_cache/fingerprint.hpp"

namespace kv_cache {

std::uint32_t hash32(std::string_view bytes) {
  std::uint32_t h = 2166136261u;
  for (const char c : bytes) {
    h ^= static_cast<std::uint8_t>(c);
    h *= 16777619u;
  }
  return h;
}

std::string truncate_utf8(std::string_view s, std::size_t max_len) {
  if (s.size() <= max_len)
    return std::string(s);
  std::size_t cut = max_len;
  // back off continuation bytes (10xxxxxx) so the cut lands on a lead byte
  while (cut > 0 && (static_cast<std::uint8_t>(s[cut]) & 0xC0) == 0x80)
    --cut;
  return std::string(s.substr(0, cut));
}

std::uint64_t fingerprint(std::string_view partition, std::string_view key) {
  return (static_cast<std::uint64_t>(hash32(partition)) << 32) |
         static_cast<std::uint64_t>(hash32(key));
}

} // namespace kv_cache

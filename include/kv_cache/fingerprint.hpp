#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace kv_cache {

std::uint32_t hash32(std::string_view bytes);

// Cuts s to at most max_len bytes without splitting a UTF-8 sequence.
std::string truncate_utf8(std::string_view s, std::size_t max_len);

// Partition hash in the high 32 bits, key hash in the low 32 bits. Both
// strings must already be truncated to the store limits.
std::uint64_t fingerprint(std::string_view partition, std::string_view key);

} // namespace kv_cache

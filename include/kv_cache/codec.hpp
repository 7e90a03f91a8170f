#pragma once

#include "kv_cache/errors.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace kv_cache {

class ByteWriter {
public:
  void put_u8(std::uint8_t b) { buf_.push_back(b); }
  void put_u32(std::uint32_t v) {
    for (int i = 0; i < 4; ++i)
      buf_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
  }
  void put_u64(std::uint64_t v) {
    for (int i = 0; i < 8; ++i)
      buf_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
  }
  void put_bytes(const void *data, std::size_t len) {
    auto *p = static_cast<const std::uint8_t *>(data);
    buf_.insert(buf_.end(), p, p + len);
  }

  std::vector<std::uint8_t> &bytes() { return buf_; }

private:
  std::vector<std::uint8_t> buf_;
};

class ByteReader {
public:
  explicit ByteReader(const std::vector<std::uint8_t> &buf) : buf_(buf) {}

  std::uint8_t get_u8() {
    need(1);
    return buf_[pos_++];
  }
  std::uint32_t get_u32() {
    need(4);
    std::uint32_t v = 0;
    for (int i = 0; i < 4; ++i)
      v |= static_cast<std::uint32_t>(buf_[pos_++]) << (8 * i);
    return v;
  }
  std::uint64_t get_u64() {
    need(8);
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i)
      v |= static_cast<std::uint64_t>(buf_[pos_++]) << (8 * i);
    return v;
  }
  void get_bytes(void *out, std::size_t len) {
    need(len);
    if (len > 0)
      std::memcpy(out, buf_.data() + pos_, len);
    pos_ += len;
  }
  bool at_end() const { return pos_ == buf_.size(); }
  std::size_t remaining() const { return buf_.size() - pos_; }

private:
  void need(std::size_t n) const {
    if (buf_.size() - pos_ < n)
      throw DecodeError("truncated payload");
  }

  const std::vector<std::uint8_t> &buf_;
  std::size_t pos_{0};
};

// Specialize to make a type storable. A specialization provides a
// `static constexpr std::uint8_t tag`, `write(ByteWriter&, const T&)` and
// `T read(ByteReader&)`. read throws DecodeError on malformed input.
template <typename T, typename Enable = void> struct ValueSerializer {};

template <typename T, typename = void>
struct is_serializable : std::false_type {};

template <typename T>
struct is_serializable<T, std::void_t<decltype(ValueSerializer<T>::tag)>>
    : std::true_type {};

template <typename T>
inline constexpr bool is_serializable_v = is_serializable<T>::value;

template <> struct ValueSerializer<bool> {
  static constexpr std::uint8_t tag = 0x01;
  static void write(ByteWriter &w, bool v) { w.put_u8(v ? 1 : 0); }
  static bool read(ByteReader &r) {
    const auto b = r.get_u8();
    if (b > 1)
      throw DecodeError("invalid bool");
    return b == 1;
  }
};

template <typename T>
struct ValueSerializer<T, std::enable_if_t<std::is_integral_v<T> &&
                                           !std::is_same_v<T, bool>>> {
  static constexpr std::uint8_t tag = static_cast<std::uint8_t>(
      0x10 + sizeof(T) * 2 + (std::is_signed_v<T> ? 1 : 0));
  static void write(ByteWriter &w, T v) {
    w.put_u64(static_cast<std::uint64_t>(v));
  }
  static T read(ByteReader &r) { return static_cast<T>(r.get_u64()); }
};

template <typename T>
struct ValueSerializer<T, std::enable_if_t<std::is_floating_point_v<T>>> {
  static constexpr std::uint8_t tag =
      static_cast<std::uint8_t>(0x30 + sizeof(T));
  static void write(ByteWriter &w, T v) { w.put_bytes(&v, sizeof(T)); }
  static T read(ByteReader &r) {
    T v;
    r.get_bytes(&v, sizeof(T));
    return v;
  }
};

template <> struct ValueSerializer<std::string> {
  static constexpr std::uint8_t tag = 0x40;
  static void write(ByteWriter &w, const std::string &v) {
    if (v.size() > UINT32_MAX)
      throw NotSerializableError("string too long");
    w.put_u32(static_cast<std::uint32_t>(v.size()));
    w.put_bytes(v.data(), v.size());
  }
  static std::string read(ByteReader &r) {
    const auto n = r.get_u32();
    if (n > r.remaining())
      throw DecodeError("truncated payload");
    std::string out(n, '\0');
    r.get_bytes(out.data(), out.size());
    return out;
  }
};

template <typename T>
struct ValueSerializer<std::vector<T>,
                       std::enable_if_t<is_serializable_v<T>>> {
  static constexpr std::uint8_t tag = 0x50;
  static void write(ByteWriter &w, const std::vector<T> &v) {
    if (v.size() > UINT32_MAX)
      throw NotSerializableError("vector too long");
    w.put_u8(ValueSerializer<T>::tag);
    w.put_u32(static_cast<std::uint32_t>(v.size()));
    for (const auto &x : v)
      ValueSerializer<T>::write(w, x);
  }
  static std::vector<T> read(ByteReader &r) {
    if (r.get_u8() != ValueSerializer<T>::tag)
      throw DecodeError("vector element type mismatch");
    const auto n = r.get_u32();
    std::vector<T> out;
    out.reserve(std::min<std::uint32_t>(n, 4096));
    for (std::uint32_t i = 0; i < n; ++i)
      out.push_back(ValueSerializer<T>::read(r));
    return out;
  }
};

class ICompressor {
public:
  virtual ~ICompressor() = default;
  virtual std::string name() const = 0;
  virtual std::vector<std::uint8_t>
  compress(const std::vector<std::uint8_t> &raw) const = 0;
  virtual std::vector<std::uint8_t>
  decompress(const std::vector<std::uint8_t> &packed) const = 0;
};

std::unique_ptr<ICompressor> make_compressor_by_name(const std::string &name);

struct EncodedValue {
  std::vector<std::uint8_t> bytes;
  bool compressed{false};
};

// Turns typed values into stored bytes and back. Payload layout: one format
// byte, one type tag byte, then the serializer output. Never touches a store.
class EntryCodec {
public:
  EntryCodec(std::unique_ptr<ICompressor> compressor,
             std::size_t compression_threshold_bytes);

  template <typename T> EncodedValue encode(const T &value) const {
    static_assert(is_serializable_v<T>,
                  "kv_cache: no ValueSerializer specialization for this type");
    ByteWriter w;
    w.put_u8(kFormatVersion);
    w.put_u8(ValueSerializer<T>::tag);
    try {
      ValueSerializer<T>::write(w, value);
    } catch (const NotSerializableError &) {
      throw;
    } catch (const std::exception &ex) {
      throw NotSerializableError(std::string("value is not serializable: ") +
                                 ex.what());
    }
    return pack(std::move(w.bytes()));
  }

  template <typename T>
  T decode(const std::vector<std::uint8_t> &bytes, bool compressed) const {
    static_assert(is_serializable_v<T>,
                  "kv_cache: no ValueSerializer specialization for this type");
    const auto raw = unpack(bytes, compressed);
    ByteReader r(raw);
    if (r.get_u8() != kFormatVersion)
      throw DecodeError("unknown payload format");
    if (r.get_u8() != ValueSerializer<T>::tag)
      throw DecodeError("stored value has a different type");
    T out = ValueSerializer<T>::read(r);
    if (!r.at_end())
      throw DecodeError("trailing bytes in payload");
    return out;
  }

  const ICompressor &compressor() const { return *compressor_; }

private:
  static constexpr std::uint8_t kFormatVersion = 1;

  EncodedValue pack(std::vector<std::uint8_t> raw) const;
  std::vector<std::uint8_t> unpack(const std::vector<std::uint8_t> &bytes,
                                   bool compressed) const;

  std::unique_ptr<ICompressor> compressor_;
  std::size_t threshold_;
};

} // namespace kv_cache

#include "kv_cache/codec.hpp"

#include <zlib.h>

namespace kv_cache {
namespace {

class NoCompressor final : public ICompressor {
public:
  std::string name() const override { return "none"; }
  std::vector<std::uint8_t>
  compress(const std::vector<std::uint8_t> &raw) const override {
    return raw;
  }
  std::vector<std::uint8_t>
  decompress(const std::vector<std::uint8_t> &packed) const override {
    return packed;
  }
};

// zlib stream format (windowBits 15).
class ZlibCompressor final : public ICompressor {
public:
  explicit ZlibCompressor(int level) : level_(level) {}

  std::string name() const override { return "zlib"; }

  std::vector<std::uint8_t>
  compress(const std::vector<std::uint8_t> &raw) const override {
    std::vector<std::uint8_t> out(
        ::compressBound(static_cast<uLong>(raw.size())) + 16);
    z_stream strm{};
    if (deflateInit2(&strm, level_, Z_DEFLATED, 15, 8, Z_DEFAULT_STRATEGY) !=
        Z_OK)
      throw NotSerializableError("deflateInit2 failed");

    strm.next_in = const_cast<Bytef *>(raw.data());
    strm.avail_in = static_cast<uInt>(raw.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    const int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (ret != Z_STREAM_END)
      throw NotSerializableError("deflate did not finish");
    out.resize(out.size() - strm.avail_out);
    return out;
  }

  std::vector<std::uint8_t>
  decompress(const std::vector<std::uint8_t> &packed) const override {
    z_stream strm{};
    if (inflateInit2(&strm, 15) != Z_OK)
      throw DecodeError("inflateInit2 failed");

    strm.next_in = const_cast<Bytef *>(packed.data());
    strm.avail_in = static_cast<uInt>(packed.size());

    std::vector<std::uint8_t> out;
    std::uint8_t chunk[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
      strm.next_out = chunk;
      strm.avail_out = sizeof(chunk);
      ret = inflate(&strm, Z_NO_FLUSH);
      if (ret != Z_OK && ret != Z_STREAM_END) {
        inflateEnd(&strm);
        throw DecodeError("corrupt compressed payload");
      }
      out.insert(out.end(), chunk, chunk + (sizeof(chunk) - strm.avail_out));
      if (ret == Z_OK && strm.avail_in == 0 && strm.avail_out != 0) {
        inflateEnd(&strm);
        throw DecodeError("truncated compressed payload");
      }
    }
    inflateEnd(&strm);
    return out;
  }

private:
  int level_;
};

} // namespace

std::unique_ptr<ICompressor> make_compressor_by_name(const std::string &name) {
  if (name == "zlib")
    return std::make_unique<ZlibCompressor>(Z_DEFAULT_COMPRESSION);
  if (name == "none")
    return std::make_unique<NoCompressor>();
  return nullptr;
}

EntryCodec::EntryCodec(std::unique_ptr<ICompressor> compressor,
                       std::size_t compression_threshold_bytes)
    : compressor_(std::move(compressor)),
      threshold_(compression_threshold_bytes) {
  if (!compressor_)
    throw InvalidArgumentError("unknown compressor");
}

EncodedValue EntryCodec::pack(std::vector<std::uint8_t> raw) const {
  EncodedValue out;
  if (raw.size() >= threshold_ && compressor_->name() != "none") {
    auto packed = compressor_->compress(raw);
    if (packed.size() < raw.size()) {
      out.bytes = std::move(packed);
      out.compressed = true;
      return out;
    }
  }
  out.bytes = std::move(raw);
  return out;
}

std::vector<std::uint8_t>
EntryCodec::unpack(const std::vector<std::uint8_t> &bytes,
                   bool compressed) const {
  if (!compressed)
    return bytes;
  return compressor_->decompress(bytes);
}

} // namespace kv_cache

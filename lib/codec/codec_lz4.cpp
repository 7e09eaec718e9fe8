// lib/codec/codec_lz4.cpp
#include "codec/codec.hpp"

#include <climits>
#include <lz4.h>

namespace codec {

// Raw LZ4 block format; the size comes from the block table, not the payload.
struct Lz4 : Codec {
  const char* name() const override { return "lz4"; }

  int compress(const uint8_t* src, size_t n, std::vector<uint8_t>& out) const override {
    if (n > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) return -1;
    out.resize(static_cast<size_t>(LZ4_compressBound(static_cast<int>(n))));
    int got = LZ4_compress_default(reinterpret_cast<const char*>(src),
                                   reinterpret_cast<char*>(out.data()),
                                   static_cast<int>(n), static_cast<int>(out.size()));
    if (got <= 0 && n != 0) { out.clear(); return -1; }
    out.resize(static_cast<size_t>(got > 0 ? got : 0));
    return 0;
  }

  int decompress(const uint8_t* src, size_t n, size_t raw_n,
                 std::vector<uint8_t>& out) const override {
    if (n > INT_MAX || raw_n > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) return -1;
    out.resize(raw_n);
    int got = LZ4_decompress_safe(reinterpret_cast<const char*>(src),
                                  reinterpret_cast<char*>(out.data()),
                                  static_cast<int>(n), static_cast<int>(raw_n));
    if (got < 0 || static_cast<size_t>(got) != raw_n) { out.clear(); return -1; }
    return 0;
  }
};

std::unique_ptr<Codec> make_codec_lz4() {
  return std::make_unique<Lz4>();
}

} // namespace codec

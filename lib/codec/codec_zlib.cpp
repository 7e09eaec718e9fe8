// lib/codec/codec_zlib.cpp
#include "codec/codec.hpp"

#include <zlib.h>

namespace codec {

struct Zlib : Codec {
  const char* name() const override { return "zlib"; }

  int compress(const uint8_t* src, size_t n, std::vector<uint8_t>& out) const override {
    uLongf bound = compressBound(static_cast<uLong>(n));
    out.resize(bound);
    int zr = compress2(out.data(), &bound, src, static_cast<uLong>(n), Z_DEFAULT_COMPRESSION);
    if (zr != Z_OK) { out.clear(); return -1; }
    out.resize(bound);
    return 0;
  }

  int decompress(const uint8_t* src, size_t n, size_t raw_n,
                 std::vector<uint8_t>& out) const override {
    out.resize(raw_n);
    uLongf got = static_cast<uLongf>(raw_n);
    // uncompress wants a non-null destination even for empty output
    Bytef dummy = 0;
    int zr = uncompress(raw_n ? out.data() : &dummy, &got, src, static_cast<uLong>(n));
    if (zr != Z_OK || got != raw_n) { out.clear(); return -1; }
    return 0;
  }
};

std::unique_ptr<Codec> make_codec_zlib() {
  return std::make_unique<Zlib>();
}

} // namespace codec

// lib/codec/codec_zstd.cpp
#include "codec/codec.hpp"

#include <zstd.h>

namespace codec {

struct Zstd : Codec {
  const int level;

  explicit Zstd(int lvl) : level(lvl) {}
  const char* name() const override { return "zstd"; }

  int compress(const uint8_t* src, size_t n, std::vector<uint8_t>& out) const override {
    out.resize(ZSTD_compressBound(n));
    size_t got = ZSTD_compress(out.data(), out.size(), src, n, level);
    if (ZSTD_isError(got)) { out.clear(); return -1; }
    out.resize(got);
    return 0;
  }

  // The frame carries its content size; it has to agree with the block table.
  int decompress(const uint8_t* src, size_t n, size_t raw_n,
                 std::vector<uint8_t>& out) const override {
    unsigned long long framed = ZSTD_getFrameContentSize(src, n);
    if (framed == ZSTD_CONTENTSIZE_ERROR || framed == ZSTD_CONTENTSIZE_UNKNOWN) return -1;
    if (framed != raw_n) return -1;

    out.resize(raw_n);
    size_t got = ZSTD_decompress(out.data(), out.size(), src, n);
    if (ZSTD_isError(got) || got != raw_n) { out.clear(); return -1; }
    return 0;
  }
};

std::unique_ptr<Codec> make_codec_zstd() {
  return std::make_unique<Zstd>(ZSTD_CLEVEL_DEFAULT);
}

} // namespace codec

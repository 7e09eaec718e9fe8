#include "codec/codec.hpp"

namespace codec {

struct Passthrough : Codec {
  const char* name() const override { return "none"; }

  int compress(const uint8_t* src, size_t n, std::vector<uint8_t>& out) const override {
    out.assign(src, src + n);
    return 0;
  }

  int decompress(const uint8_t* src, size_t n, size_t raw_n,
                 std::vector<uint8_t>& out) const override {
    if (n != raw_n) return -1;
    out.assign(src, src + n);
    return 0;
  }
};

std::unique_ptr<Codec> make_codec_none() {
  return std::make_unique<Passthrough>();
}

} // namespace codec

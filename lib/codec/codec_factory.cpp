#include "codec/codec.hpp"

namespace codec {

// forward decls provided by each codec TU
std::unique_ptr<Codec> make_codec_none();
std::unique_ptr<Codec> make_codec_zlib();
std::unique_ptr<Codec> make_codec_zstd();
std::unique_ptr<Codec> make_codec_lz4();

const char* algo_name(Algo a){
  switch (a) {
    case Algo::NONE: return "none";
    case Algo::ZLIB: return "zlib";
    case Algo::ZSTD: return "zstd";
    case Algo::LZ4:  return "lz4";
  }
  return "?";
}

int parse_algo(const std::string& name, Algo& out){
  if (name == "none") { out = Algo::NONE; return 0; }
  if (name == "zlib") { out = Algo::ZLIB; return 0; }
  if (name == "zstd") { out = Algo::ZSTD; return 0; }
  if (name == "lz4")  { out = Algo::LZ4;  return 0; }
  return -1;
}

bool algo_known(uint8_t id){
  return id <= static_cast<uint8_t>(Algo::LZ4);
}

std::unique_ptr<Codec> make_codec(Algo a) {
  switch (a) {
    case Algo::NONE: return make_codec_none();
    case Algo::ZLIB: return make_codec_zlib();
    case Algo::ZSTD: return make_codec_zstd();
    case Algo::LZ4:  return make_codec_lz4();
    default: return {};
  }
}

} // namespace codec

#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace codec {

enum class Algo : uint8_t { NONE = 0, ZLIB = 1, ZSTD = 2, LZ4 = 3 };

// Stateless block codec; one instance is shared by all workers.
struct Codec {
  virtual ~Codec() = default;

  virtual const char* name() const = 0;

  // Replaces out with the compressed form of [src, src+n). 0 on success.
  virtual int compress(const uint8_t* src, size_t n,
                       std::vector<uint8_t>& out) const = 0;

  // raw_n is the exact expected output size; any other size is an error.
  virtual int decompress(const uint8_t* src, size_t n, size_t raw_n,
                         std::vector<uint8_t>& out) const = 0;
};

const char* algo_name(Algo a);
int parse_algo(const std::string& name, Algo& out);
bool algo_known(uint8_t id);

// Central factory (implemented in lib/codec/codec_factory.cpp)
std::unique_ptr<Codec> make_codec(Algo);

} // namespace codec

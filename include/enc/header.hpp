#pragma once
#include <cstdint>
#include <cstddef>
#include "params.hpp"

namespace enc {

#pragma pack(push, 1)
struct Header {
  uint8_t  magic[4];        // "QLTX"
  uint8_t  version[3];      // 4.0.0
  uint8_t  reserved[3];     // zero
  uint32_t meta_len_be;     // big-endian, exact metadata size
};
#pragma pack(pop)

inline constexpr size_t HEADER_SIZE = sizeof(Header);
static_assert(HEADER_SIZE == 14, "Header layout/size mismatch");

void make_header(uint32_t meta_len, Header& h);

// 0 ok, -1 short read, -2 bad magic, -3 unsupported version,
// -4 metadata length past end of file
int parse_header(const uint8_t* p, size_t n, uint64_t file_len, Header& h);

int read_header(int fd, uint64_t file_len, Header& h);
int write_header(int fd, const Header& h);

uint32_t meta_len(const Header& h);

} // namespace enc

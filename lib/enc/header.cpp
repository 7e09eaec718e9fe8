#include <sys/types.h>
#include <unistd.h>
#include <cstring>

#include "enc/header.hpp"
#include "util.hpp"

namespace enc {

void make_header(uint32_t len, Header& h){
  std::memset(&h, 0, sizeof(h));
  std::memcpy(h.magic, MAGIC, sizeof(h.magic));
  std::memcpy(h.version, FORMAT_VERSION, sizeof(h.version));
  h.meta_len_be = util::enc::htobe_u32(len);
}

uint32_t meta_len(const Header& h){
  return util::enc::be32toh_u32(h.meta_len_be);
}

int parse_header(const uint8_t* p, size_t n, uint64_t file_len, Header& h){
  if (n < sizeof(h)) return -1;
  std::memcpy(&h, p, sizeof(h));

  if (std::memcmp(h.magic, MAGIC, sizeof(h.magic)) != 0) return -2;
  if (std::memcmp(h.version, FORMAT_VERSION, sizeof(h.version)) != 0) return -3;
  if (file_len < HEADER_SIZE || meta_len(h) > file_len - HEADER_SIZE) return -4;
  return 0;
}

int read_header(int fd, uint64_t file_len, Header& h){
  uint8_t buf[HEADER_SIZE];
  ssize_t n = util::fs::full_pread(fd, buf, sizeof(buf), 0);
  if (n < 0) return -1;
  return parse_header(buf, (size_t)n, file_len, h);
}

int write_header(int fd, const Header& h){
  return (util::fs::full_pwrite(fd, &h, sizeof(h), 0) == (ssize_t)sizeof(h)) ? 0 : -1;
}

}

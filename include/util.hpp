#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>

namespace util {

std::string expand_args(const std::string& path);

// QLTX_DEBUG set to anything but "" or "0"
bool debug();

// QLTX_THREADS if set and valid, else hardware concurrency (at least 1)
unsigned default_threads();

namespace fs {

ssize_t full_pread(int fd, void *buf, size_t n, off_t offset);
ssize_t full_pwrite(int fd, const void *buf, size_t n, off_t offset);
ssize_t full_read(int fd, void *buf, size_t n);
ssize_t full_write(int fd, const void *buf, size_t n);

int file_size(int fd, uint64_t &out);

// Temp file beside dest; finalized by rename only on success.
int open_temp(const std::string &dest, std::string &tmp_path);
int commit_temp(int fd, const std::string &tmp_path, const std::string &dest);
void discard_temp(int fd, const std::string &tmp_path);

}

namespace enc {

// Endian helpers
uint64_t htobe_u64(uint64_t x);
uint32_t htobe_u32(uint32_t x);
uint64_t be64toh_u64(uint64_t x);
uint32_t be32toh_u32(uint32_t x);

void put_be16(uint8_t *p, uint16_t v);
void put_be32(uint8_t *p, uint32_t v);
void put_be64(uint8_t *p, uint64_t v);
uint16_t get_be16(const uint8_t *p);
uint32_t get_be32(const uint8_t *p);
uint64_t get_be64(const uint8_t *p);

std::string to_hex(const uint8_t *p, size_t n);

}

}

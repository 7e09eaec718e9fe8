#include <atomic>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <thread>
#include <unistd.h>

#include "util.hpp"


namespace util {

std::string expand_args(const std::string& path) {
  if (path.empty() || path[0] != '~') return path;

  if (path.size() == 1 || path[1] == '/') {
      const char* h = std::getenv("HOME");
      if (!h) {
          if (auto* pw = getpwuid(getuid())) h = pw->pw_dir;
      }
      return (h ? std::string(h) : std::string()) + path.substr(1);
  }

  size_t slash = path.find('/');
  std::string user = path.substr(1, (slash == std::string::npos ? std::string::npos : slash - 1));
  if (auto* pw = getpwnam(user.c_str())) {
      std::string home = pw->pw_dir;
      return home + (slash == std::string::npos ? "" : path.substr(slash));
  }
  return path;
}

bool debug(){
  static const bool on = [](){
    const char* v = std::getenv("QLTX_DEBUG");
    return v && *v && std::strcmp(v, "0") != 0;
  }();
  return on;
}

unsigned default_threads(){
  if (const char* v = std::getenv("QLTX_THREADS")) {
    char* end = nullptr;
    unsigned long n = std::strtoul(v, &end, 10);
    if (end != v && *end == '\0' && n > 0 && n <= 1024) return static_cast<unsigned>(n);
    std::fprintf(stderr, "[CONF] ignoring QLTX_THREADS='%s'\n", v);
  }
  unsigned hw = std::thread::hardware_concurrency();
  return hw ? hw : 1;
}

}

namespace util::fs {

ssize_t full_pread(int fd, void *buf, size_t n, off_t offset){
  uint8_t *p = static_cast<uint8_t*>(buf);
  
  size_t done = 0;
  while (done < n){
    ssize_t r = pread(fd, p+done, n-done, offset + (off_t)done);
    if (r < 0){
      if (errno==EINTR) continue;
      return -1;
    }
    if (r == 0) break; // EOF
    done += (size_t)r;
  }
  return (ssize_t)done;
}

ssize_t full_pwrite(int fd, const void *buf, size_t n, off_t offset){
  const uint8_t *p = static_cast<const uint8_t*>(buf);
  
  size_t done = 0;
  while (done < n){
    ssize_t w = pwrite(fd, p+done, n-done, offset + (off_t)done);
    if (w < 0){
      if (errno==EINTR) continue;
      return -1;
    }
    if (w == 0) break;
    done += (size_t)w;
  }
  return (ssize_t)done;
}

ssize_t full_read(int fd, void *buf, size_t n){
  uint8_t *p = static_cast<uint8_t*>(buf);

  size_t done = 0;
  while (done < n){
    ssize_t r = read(fd, p+done, n-done);
    if (r < 0){
      if (errno==EINTR) continue;
      return -1;
    }
    if (r == 0) break; // EOF
    done += (size_t)r;
  }
  return (ssize_t)done;
}

ssize_t full_write(int fd, const void *buf, size_t n){
  const uint8_t *p = static_cast<const uint8_t*>(buf);

  size_t done = 0;
  while (done < n){
    ssize_t w = write(fd, p+done, n-done);
    if (w < 0){
      if (errno==EINTR) continue;
      return -1;
    }
    if (w == 0) break;
    done += (size_t)w;
  }
  return (ssize_t)done;
}

int file_size(int fd, uint64_t &out){
  struct stat st{};
  if (fstat(fd, &st) == -1) return -errno;
  if (!S_ISREG(st.st_mode)) return -EINVAL;
  out = static_cast<uint64_t>(st.st_size);
  return 0;
}

int open_temp(const std::string &dest, std::string &tmp_path){
  // O_EXCL on a fresh name; the kernel applies the umask to 0666
  static std::atomic<unsigned> seq{0};
  int se = EEXIST;
  for (int attempt = 0; attempt < 100 && se == EEXIST; attempt++) {
    char suffix[48];
    std::snprintf(suffix, sizeof(suffix), ".tmp.%ld.%u", (long)getpid(), seq.fetch_add(1));
    tmp_path = dest + suffix;
    int fd = open(tmp_path.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, 0666);
    if (fd >= 0) return fd;
    se = errno;
  }
  std::fprintf(stderr, "[IO] cannot create temp for '%s': %s\n", dest.c_str(), std::strerror(se));
  tmp_path.clear();
  return -se;
}

int commit_temp(int fd, const std::string &tmp_path, const std::string &dest){
  if (fsync(fd) == -1 || close(fd) == -1) {
    int se = errno;
    unlink(tmp_path.c_str());
    return -se;
  }
  if (rename(tmp_path.c_str(), dest.c_str()) == -1) {
    int se = errno;
    std::fprintf(stderr, "[IO] rename '%s' -> '%s' failed: %s\n", tmp_path.c_str(), dest.c_str(), std::strerror(se));
    unlink(tmp_path.c_str());
    return -se;
  }
  return 0;
}

void discard_temp(int fd, const std::string &tmp_path){
  if (fd >= 0) close(fd);
  if (!tmp_path.empty()) unlink(tmp_path.c_str());
}

}

namespace util::enc {

uint64_t htobe_u64(uint64_t x){
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
  return __builtin_bswap64(x);
#else
  return x;
#endif

}
uint32_t htobe_u32(uint32_t x){
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
  return __builtin_bswap32(x);
#else
  return x;
#endif

}

uint64_t be64toh_u64(uint64_t x){ return htobe_u64(x); }
uint32_t be32toh_u32(uint32_t x){ return htobe_u32(x); }

void put_be16(uint8_t *p, uint16_t v){
  p[0] = (uint8_t)(v >> 8);
  p[1] = (uint8_t)v;
}
void put_be32(uint8_t *p, uint32_t v){
  uint32_t be = htobe_u32(v);
  std::memcpy(p, &be, 4);
}
void put_be64(uint8_t *p, uint64_t v){
  uint64_t be = htobe_u64(v);
  std::memcpy(p, &be, 8);
}
uint16_t get_be16(const uint8_t *p){
  return (uint16_t)((p[0] << 8) | p[1]);
}
uint32_t get_be32(const uint8_t *p){
  uint32_t be; std::memcpy(&be, p, 4);
  return be32toh_u32(be);
}
uint64_t get_be64(const uint8_t *p){
  uint64_t be; std::memcpy(&be, p, 8);
  return be64toh_u64(be);
}

std::string to_hex(const uint8_t *p, size_t n){
  static const char digits[] = "0123456789abcdef";
  std::string s(n * 2, '0');
  for (size_t i = 0; i < n; i++){
    s[2*i]   = digits[p[i] >> 4];
    s[2*i+1] = digits[p[i] & 0x0f];
  }
  return s;
}

}

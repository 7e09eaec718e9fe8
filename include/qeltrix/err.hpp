#pragma once
#include <cstdint>

namespace qeltrix {

inline constexpr int E_OK        =  0;
inline constexpr int E_IO        = -1;  // open/read/write/rename
inline constexpr int E_FORMAT    = -2;  // magic, version, length field, metadata structure
inline constexpr int E_INTEGRITY = -3;  // mode_tag, block tag, content binding
inline constexpr int E_SIGNATURE = -4;  // missing or mismatching metadata signature
inline constexpr int E_UNWRAP    = -5;  // key envelope could not be opened
inline constexpr int E_CONFIG    = -6;  // rejected before any I/O
inline constexpr int E_CRYPTO    = -7;  // primitive failure (allocation, library)

// Context of the first failure of an operation. Never carries key bytes.
struct ErrCtx {
  int         code{E_OK};
  int64_t     block{-1};     // block index, -1 when not block related
  const char* check{""};     // which check failed

  int set(int c, const char* what, int64_t blk = -1){
    if (code == E_OK) { code = c; check = what; block = blk; }
    return c;
  }
};

const char* strerr(int code);

} // namespace qeltrix

#pragma once
#include <cstdint>
#include <cstddef>

namespace enc {
inline constexpr uint8_t  MAGIC[4]          = {'Q','L','T','X'};
inline constexpr uint8_t  FORMAT_VERSION[3] = {4, 0, 0};
inline constexpr uint32_t DEFAULT_BLOCK     = 64 * 1024;  // 64 KiB
inline constexpr uint64_t DEFAULT_HEAD      = 64 * 1024;  // single_pass_firstN
inline constexpr uint32_t MAX_BLOCK         = 64u << 20;  // sanity
inline constexpr size_t   TAG_SIZE          = 16;         // GCM / Poly1305 tag
inline constexpr size_t   KEY_SIZE          = 32;         // AES-256 / ChaCha20
inline constexpr size_t   NONCE_SIZE        = 12;         // GCM standard
inline constexpr size_t   DIGEST_SIZE       = 32;         // SHA-256
inline constexpr size_t   MODE_TAG_LEN      = 2 * DIGEST_SIZE;      // hex
inline constexpr size_t   AAD_LEN           = 4 + 4 + 4;            // magic | index | plain_len
inline constexpr size_t   MAX_META          = 256u << 20;
} // namespace enc

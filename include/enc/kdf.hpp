#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <openssl/types.h>

#include "params.hpp"
#include "meta.hpp"

namespace enc {

// SHA-256 over the compressed stream: all of it in two_pass,
// the first head_bytes of it in single_pass_firstN. Feed in block order.
class HeadHasher {
public:
  HeadHasher(Mode mode, uint64_t head_bytes);
  ~HeadHasher();
  HeadHasher(const HeadHasher&) = delete;
  HeadHasher& operator=(const HeadHasher&) = delete;

  void update(const uint8_t* p, size_t n);

  // Key input is complete; later bytes are ignored
  bool saturated() const { return fed_ >= limit_; }
  uint64_t fed() const { return fed_; }

  int finish(uint8_t digest[DIGEST_SIZE]);

private:
  EVP_MD_CTX* ctx_;
  uint64_t    limit_;
  uint64_t    fed_{0};
  bool        err_{false};
};

int derive_dek(Mode mode, const uint8_t digest[DIGEST_SIZE],
               std::array<uint8_t,KEY_SIZE>& dek);

int derive_nonce_base(const std::array<uint8_t,KEY_SIZE>& dek,
                      std::array<uint8_t,NONCE_SIZE>& nonce_base);

// HMAC over the derivation parameters, lowercase hex
int compute_mode_tag(const Metadata& md, const std::array<uint8_t,KEY_SIZE>& dek,
                     std::string& out);

// 0 if md.mode_tag matches, -1 otherwise
int check_mode_tag(const Metadata& md, const std::array<uint8_t,KEY_SIZE>& dek);

} // namespace enc

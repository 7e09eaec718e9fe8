#include <cstring>
#include <limits>
#include <openssl/crypto.h>
#include <openssl/evp.h>

#include "enc/crypto.hpp"
#include "enc/kdf.hpp"
#include "util.hpp"

namespace enc {

static const char DEK_SALT[] = "qeltrix-dek-v4";
static const char TAG_LABEL[] = "qltx-mode-tag";

HeadHasher::HeadHasher(Mode mode, uint64_t head_bytes)
  : ctx_(EVP_MD_CTX_new()),
    limit_(mode == Mode::TWO_PASS ? std::numeric_limits<uint64_t>::max() : head_bytes) {
  if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) err_ = true;
}

HeadHasher::~HeadHasher(){
  EVP_MD_CTX_free(ctx_);
}

void HeadHasher::update(const uint8_t* p, size_t n){
  if (err_ || saturated()) return;
  uint64_t take = limit_ - fed_;
  if (take > n) take = n;
  if (EVP_DigestUpdate(ctx_, p, (size_t)take) != 1) { err_ = true; return; }
  fed_ += take;
}

int HeadHasher::finish(uint8_t digest[DIGEST_SIZE]){
  if (err_) return -1;
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_, digest, &len) != 1 || len != DIGEST_SIZE) return -1;
  return 0;
}

int derive_dek(Mode mode, const uint8_t digest[DIGEST_SIZE],
               std::array<uint8_t,KEY_SIZE>& dek){
  return hkdf_sha256(digest, DIGEST_SIZE,
                     reinterpret_cast<const uint8_t*>(DEK_SALT), sizeof(DEK_SALT) - 1,
                     mode_name(mode),
                     dek.data(), dek.size());
}

int derive_nonce_base(const std::array<uint8_t,KEY_SIZE>& dek,
                      std::array<uint8_t,NONCE_SIZE>& nonce_base){
  return hkdf_sha256(dek.data(), dek.size(), nullptr, 0, "qltx-nonce-base",
                     nonce_base.data(), nonce_base.size());
}

int compute_mode_tag(const Metadata& md, const std::array<uint8_t,KEY_SIZE>& dek,
                     std::string& out){
  // label | mode | head_bytes | block_size | compression | cipher | total_len | block_count
  uint8_t msg[sizeof(TAG_LABEL) - 1 + 1 + 8 + 4 + 1 + 1 + 8 + 4];
  uint8_t* p = msg;
  std::memcpy(p, TAG_LABEL, sizeof(TAG_LABEL) - 1); p += sizeof(TAG_LABEL) - 1;
  *p++ = static_cast<uint8_t>(md.mode);
  util::enc::put_be64(p, md.head_bytes); p += 8;
  util::enc::put_be32(p, md.block_size); p += 4;
  *p++ = static_cast<uint8_t>(md.compression);
  *p++ = static_cast<uint8_t>(md.cipher);
  util::enc::put_be64(p, md.total_len); p += 8;
  util::enc::put_be32(p, static_cast<uint32_t>(md.blocks.size())); p += 4;

  uint8_t mac[DIGEST_SIZE];
  if (hmac_sha256(dek.data(), dek.size(), msg, (size_t)(p - msg), mac) != 0) return -1;
  out = util::enc::to_hex(mac, sizeof(mac));
  return 0;
}

int check_mode_tag(const Metadata& md, const std::array<uint8_t,KEY_SIZE>& dek){
  std::string expect;
  if (compute_mode_tag(md, dek, expect) != 0) return -1;
  if (md.mode_tag.size() != expect.size()) return -1;
  return CRYPTO_memcmp(md.mode_tag.data(), expect.data(), expect.size()) == 0 ? 0 : -1;
}

} // namespace enc

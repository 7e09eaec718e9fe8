#include <array>
#include <cstring>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/crypto.h>

#include "enc/crypto.hpp"
#include "util.hpp"

namespace enc {

static const EVP_CIPHER* evp_cipher(Cipher c){
  switch (c){
    case Cipher::AES256_GCM:        return EVP_aes_256_gcm();
    case Cipher::CHACHA20_POLY1305: return EVP_chacha20_poly1305();
  }
  return nullptr;
}

const char* cipher_name(Cipher c){
  switch (c){
    case Cipher::AES256_GCM:        return "aes256-gcm";
    case Cipher::CHACHA20_POLY1305: return "chacha20-poly1305";
  }
  return "?";
}

int parse_cipher(const std::string& name, Cipher& out){
  if (name == "aes256-gcm")        { out = Cipher::AES256_GCM; return 0; }
  if (name == "chacha20-poly1305") { out = Cipher::CHACHA20_POLY1305; return 0; }
  return -1;
}

bool cipher_known(uint8_t id){
  return id <= static_cast<uint8_t>(Cipher::CHACHA20_POLY1305);
}

// HKDF Context
int hkdf_sha256(const uint8_t* ikm, size_t ikm_len,
                const uint8_t* salt, size_t salt_len,
                const char* info,
                uint8_t* out, size_t out_len){
  int rc = -1;
  EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
  if (!pctx) return -1;

  do {
    if (EVP_PKEY_derive_init(pctx) <= 0) break;
    if (EVP_PKEY_CTX_set_hkdf_md(pctx, EVP_sha256()) <= 0) break;
    if (salt_len > 0 && EVP_PKEY_CTX_set1_hkdf_salt(pctx, salt, (int)salt_len) <= 0) break;
    if (EVP_PKEY_CTX_set1_hkdf_key(pctx, ikm, (int)ikm_len) <= 0) break;
    if (EVP_PKEY_CTX_add1_hkdf_info(
      pctx,
      reinterpret_cast<const unsigned char*>(info),
      static_cast<int>(std::strlen(info))) <= 0) break;
    size_t outlen = out_len;
    if (EVP_PKEY_derive(pctx, out, &outlen) <= 0 || outlen != out_len) break;
    rc = 0;
  } while(0);

  EVP_PKEY_CTX_free(pctx);
  return rc;
}

int sha256(const uint8_t* p, size_t n, uint8_t out[DIGEST_SIZE]){
  unsigned int len = 0;
  if (EVP_Digest(p, n, out, &len, EVP_sha256(), nullptr) != 1) return -1;
  return len == DIGEST_SIZE ? 0 : -1;
}

int hmac_sha256(const uint8_t* key, size_t key_len,
                const uint8_t* p, size_t n,
                uint8_t out[DIGEST_SIZE]){
  unsigned int len = 0;
  if (!HMAC(EVP_sha256(), key, (int)key_len, p, n, out, &len)) return -1;
  return len == DIGEST_SIZE ? 0 : -1;
}

void make_block_nonce(const std::array<uint8_t,NONCE_SIZE>& base,
                      uint64_t idx,
                      uint8_t out[NONCE_SIZE]) {
  // Copy base, XOR the last 8 bytes with big-endian idx
  std::memcpy(out, base.data(), NONCE_SIZE);
  uint8_t be[8];
  util::enc::put_be64(be, idx);
  for (int i=0;i<8;i++) out[NONCE_SIZE-8+i] ^= be[i];
}

int aead_seal(Cipher cipher,
              const uint8_t key[KEY_SIZE],
              const uint8_t nonce[NONCE_SIZE],
              const uint8_t* pt, size_t pt_len,
              const uint8_t* aad, size_t aad_len,
              uint8_t* ct, uint8_t tag[TAG_SIZE]) {
  const EVP_CIPHER* ec = evp_cipher(cipher);
  if (!ec) return -1;
  int ok=-1, outl=0, tmplen=0;
  EVP_CIPHER_CTX* c = EVP_CIPHER_CTX_new();
  if (!c) return -1;
  do {
    // Init new context with key + iv
    if (EVP_EncryptInit_ex(c, ec, nullptr, nullptr, nullptr) != 1) break;
    if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_AEAD_SET_IVLEN, NONCE_SIZE, nullptr) != 1) break;
    if (EVP_EncryptInit_ex(c, nullptr, nullptr, key, nonce) != 1) break;

    if (aad_len > 0 && EVP_EncryptUpdate(c, nullptr, &tmplen, aad, (int)aad_len) != 1) break;

    if (pt_len > 0 && EVP_EncryptUpdate(c, ct, &outl, pt, (int)pt_len) != 1) break;
    if (EVP_EncryptFinal_ex(c, ct + outl, &tmplen) != 1) break;
    if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_AEAD_GET_TAG, TAG_SIZE, tag) != 1) break;        // Export the tag per block
    ok = (outl + tmplen == (int)pt_len) ? 0 : -1;
  } while(0);
  EVP_CIPHER_CTX_free(c);
  return ok;
}

int aead_open(Cipher cipher,
              const uint8_t key[KEY_SIZE],
              const uint8_t nonce[NONCE_SIZE],
              const uint8_t* ct, size_t ct_len,
              const uint8_t* aad, size_t aad_len,
              const uint8_t tag[TAG_SIZE],
              uint8_t* pt) {
  const EVP_CIPHER* ec = evp_cipher(cipher);
  if (!ec) return -1;
  int outl=0, tmplen=0, ok=-1;
  EVP_CIPHER_CTX* c = EVP_CIPHER_CTX_new();
  if (!c) return -1;
  do {
    if (EVP_DecryptInit_ex(c, ec, nullptr, nullptr, nullptr) != 1) break;
    if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_AEAD_SET_IVLEN, NONCE_SIZE, nullptr) != 1) break;
    if (EVP_DecryptInit_ex(c, nullptr, nullptr, key, nonce) != 1) break;
    
    if (aad_len > 0 && EVP_DecryptUpdate(c, nullptr, &tmplen, aad, (int)aad_len) != 1) break;
    
    if (ct_len > 0 && EVP_DecryptUpdate(c, pt, &outl, ct, (int)ct_len) != 1) break;
    if (EVP_CIPHER_CTX_ctrl(c, EVP_CTRL_AEAD_SET_TAG, TAG_SIZE, const_cast<uint8_t*>(tag)) != 1) break;     // Verify the tag per block
    if (EVP_DecryptFinal_ex(c, pt + outl, &tmplen) != 1) break;
    ok = 0;
  } while(0);
  EVP_CIPHER_CTX_free(c);
  return ok;
}

}

#pragma once
#include <sys/types.h>
#include <cstdint>
#include <array>
#include <string>

#include "params.hpp"

namespace enc {

enum class Cipher : uint8_t { AES256_GCM = 0, CHACHA20_POLY1305 = 1 };

const char* cipher_name(Cipher c);
// Returns 0 and sets out for a known name, -1 otherwise
int parse_cipher(const std::string& name, Cipher& out);
bool cipher_known(uint8_t id);

// HKDF-SHA256 (extract + expand), out_len <= 255*32
int hkdf_sha256(const uint8_t* ikm, size_t ikm_len,
                const uint8_t* salt, size_t salt_len,
                const char* info,
                uint8_t* out, size_t out_len);

int sha256(const uint8_t* p, size_t n, uint8_t out[DIGEST_SIZE]);

int hmac_sha256(const uint8_t* key, size_t key_len,
                const uint8_t* p, size_t n,
                uint8_t out[DIGEST_SIZE]);

// Nonce for block i = nonce_base with last 8 bytes XOR block_index (big-endian)
void make_block_nonce(const std::array<uint8_t,NONCE_SIZE>& base,
                      uint64_t block_idx,
                      uint8_t out[NONCE_SIZE]);

// AEAD primitives (bufs may alias). open() returns -1 on tag mismatch.
int aead_seal(Cipher c,
              const uint8_t key[KEY_SIZE],
              const uint8_t nonce[NONCE_SIZE],
              const uint8_t* pt, size_t pt_len,
              const uint8_t* aad, size_t aad_len,
              uint8_t* ct, uint8_t tag[TAG_SIZE]);

int aead_open(Cipher c,
              const uint8_t key[KEY_SIZE],
              const uint8_t nonce[NONCE_SIZE],
              const uint8_t* ct, size_t ct_len,
              const uint8_t* aad, size_t aad_len,
              const uint8_t tag[TAG_SIZE],
              uint8_t* pt);

}

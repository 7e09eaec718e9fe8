#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>

#include "params.hpp"

namespace enc {

struct PKeyFree { void operator()(EVP_PKEY* k) const { EVP_PKEY_free(k); } };
using PKey = std::unique_ptr<EVP_PKEY, PKeyFree>;

// PEM key files. 0 on success.
int load_public_key(const std::string& path, PKey& out);
int load_private_key(const std::string& path, PKey& out);
int write_public_pem(EVP_PKEY* k, const std::string& path);
int write_private_pem(EVP_PKEY* k, const std::string& path);

int generate_rsa(unsigned bits, PKey& out);

// Hex SHA-256 of the DER SubjectPublicKeyInfo; same value for both halves of a pair
int key_id(EVP_PKEY* k, std::string& out);

// RSA-OAEP(SHA-256). unwrap yields -1 for every failure cause alike.
int wrap_key(EVP_PKEY* pub, const std::array<uint8_t,KEY_SIZE>& dek,
             std::vector<uint8_t>& out);
int unwrap_key(EVP_PKEY* priv, const std::vector<uint8_t>& wrapped,
               std::array<uint8_t,KEY_SIZE>& dek);

// RSA keys sign with PSS/SHA-256, Ed25519 natively, EC with SHA-256
int sign_bytes(EVP_PKEY* priv, const uint8_t* p, size_t n, std::vector<uint8_t>& sig);
// 0 valid, -1 invalid or error
int verify_bytes(EVP_PKEY* pub, const uint8_t* p, size_t n, const std::vector<uint8_t>& sig);

} // namespace enc

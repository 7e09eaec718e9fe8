#include <algorithm>
#include <cstdio>
#include <openssl/bio.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include "enc/asym.hpp"
#include "enc/crypto.hpp"
#include "util.hpp"

namespace enc {

namespace {

struct BioFree { void operator()(BIO* b) const { BIO_free(b); } };
struct MdCtxFree { void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); } };
struct PCtxFree { void operator()(EVP_PKEY_CTX* c) const { EVP_PKEY_CTX_free(c); } };

using Bio   = std::unique_ptr<BIO, BioFree>;
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxFree>;
using PCtx  = std::unique_ptr<EVP_PKEY_CTX, PCtxFree>;

bool is_rsa(EVP_PKEY* k){ return EVP_PKEY_get_base_id(k) == EVP_PKEY_RSA; }

// Ed25519/Ed448 sign the message directly
const EVP_MD* sig_md(EVP_PKEY* k){
  int id = EVP_PKEY_get_base_id(k);
  if (id == EVP_PKEY_ED25519 || id == EVP_PKEY_ED448) return nullptr;
  return EVP_sha256();
}

int set_pss(EVP_PKEY_CTX* pctx){
  if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) <= 0) return -1;
  if (EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) <= 0) return -1;
  return 0;
}

int set_oaep(EVP_PKEY_CTX* pctx){
  if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_OAEP_PADDING) <= 0) return -1;
  if (EVP_PKEY_CTX_set_rsa_oaep_md(pctx, EVP_sha256()) <= 0) return -1;
  if (EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, EVP_sha256()) <= 0) return -1;
  return 0;
}

}

int load_public_key(const std::string& path, PKey& out){
  Bio bio(BIO_new_file(path.c_str(), "rb"));
  if (!bio) { std::fprintf(stderr, "[ASYM] cannot open '%s'\n", path.c_str()); return -1; }
  out.reset(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
  if (!out) { std::fprintf(stderr, "[ASYM] '%s' is not a PEM public key\n", path.c_str()); return -1; }
  return 0;
}

int load_private_key(const std::string& path, PKey& out){
  Bio bio(BIO_new_file(path.c_str(), "rb"));
  if (!bio) { std::fprintf(stderr, "[ASYM] cannot open '%s'\n", path.c_str()); return -1; }
  out.reset(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
  if (!out) { std::fprintf(stderr, "[ASYM] '%s' is not a PEM private key\n", path.c_str()); return -1; }
  return 0;
}

int write_public_pem(EVP_PKEY* k, const std::string& path){
  Bio bio(BIO_new_file(path.c_str(), "wb"));
  if (!bio) return -1;
  return PEM_write_bio_PUBKEY(bio.get(), k) == 1 ? 0 : -1;
}

int write_private_pem(EVP_PKEY* k, const std::string& path){
  Bio bio(BIO_new_file(path.c_str(), "wb"));
  if (!bio) return -1;
  return PEM_write_bio_PrivateKey(bio.get(), k, nullptr, nullptr, 0, nullptr, nullptr) == 1 ? 0 : -1;
}

int generate_rsa(unsigned bits, PKey& out){
  PCtx pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
  if (!pctx) return -1;
  if (EVP_PKEY_keygen_init(pctx.get()) <= 0) return -1;
  if (EVP_PKEY_CTX_set_rsa_keygen_bits(pctx.get(), (int)bits) <= 0) return -1;
  EVP_PKEY* k = nullptr;
  if (EVP_PKEY_keygen(pctx.get(), &k) <= 0) return -1;
  out.reset(k);
  return 0;
}

int key_id(EVP_PKEY* k, std::string& out){
  unsigned char* der = nullptr;
  int len = i2d_PUBKEY(k, &der);
  if (len <= 0) return -1;
  uint8_t digest[DIGEST_SIZE];
  int rc = sha256(der, (size_t)len, digest);
  OPENSSL_free(der);
  if (rc != 0) return -1;
  out = util::enc::to_hex(digest, sizeof(digest));
  return 0;
}

int wrap_key(EVP_PKEY* pub, const std::array<uint8_t,KEY_SIZE>& dek,
             std::vector<uint8_t>& out){
  if (!is_rsa(pub)) { std::fprintf(stderr, "[ASYM] recipient key must be RSA\n"); return -1; }
  PCtx pctx(EVP_PKEY_CTX_new(pub, nullptr));
  if (!pctx) return -1;
  if (EVP_PKEY_encrypt_init(pctx.get()) <= 0) return -1;
  if (set_oaep(pctx.get()) != 0) return -1;

  size_t outlen = 0;
  if (EVP_PKEY_encrypt(pctx.get(), nullptr, &outlen, dek.data(), dek.size()) <= 0) return -1;
  out.resize(outlen);
  if (EVP_PKEY_encrypt(pctx.get(), out.data(), &outlen, dek.data(), dek.size()) <= 0) return -1;
  out.resize(outlen);
  return 0;
}

int unwrap_key(EVP_PKEY* priv, const std::vector<uint8_t>& wrapped,
               std::array<uint8_t,KEY_SIZE>& dek){
  if (!is_rsa(priv)) return -1;
  PCtx pctx(EVP_PKEY_CTX_new(priv, nullptr));
  if (!pctx) return -1;
  if (EVP_PKEY_decrypt_init(pctx.get()) <= 0) return -1;
  if (set_oaep(pctx.get()) != 0) return -1;

  size_t outlen = 0;
  if (EVP_PKEY_decrypt(pctx.get(), nullptr, &outlen, wrapped.data(), wrapped.size()) <= 0) return -1;
  std::vector<uint8_t> buf(outlen);
  int rc = -1;
  if (EVP_PKEY_decrypt(pctx.get(), buf.data(), &outlen, wrapped.data(), wrapped.size()) > 0 &&
      outlen == KEY_SIZE) {
    std::copy(buf.begin(), buf.begin() + KEY_SIZE, dek.begin());
    rc = 0;
  }
  OPENSSL_cleanse(buf.data(), buf.size());
  return rc;
}

int sign_bytes(EVP_PKEY* priv, const uint8_t* p, size_t n, std::vector<uint8_t>& sig){
  MdCtx mctx(EVP_MD_CTX_new());
  if (!mctx) return -1;
  EVP_PKEY_CTX* pctx = nullptr;   // owned by mctx
  if (EVP_DigestSignInit(mctx.get(), &pctx, sig_md(priv), nullptr, priv) <= 0) return -1;
  if (is_rsa(priv) && set_pss(pctx) != 0) return -1;

  size_t siglen = 0;
  if (EVP_DigestSign(mctx.get(), nullptr, &siglen, p, n) <= 0) return -1;
  sig.resize(siglen);
  if (EVP_DigestSign(mctx.get(), sig.data(), &siglen, p, n) <= 0) return -1;
  sig.resize(siglen);
  return 0;
}

int verify_bytes(EVP_PKEY* pub, const uint8_t* p, size_t n, const std::vector<uint8_t>& sig){
  MdCtx mctx(EVP_MD_CTX_new());
  if (!mctx) return -1;
  EVP_PKEY_CTX* pctx = nullptr;
  if (EVP_DigestVerifyInit(mctx.get(), &pctx, sig_md(pub), nullptr, pub) <= 0) return -1;
  if (is_rsa(pub) && set_pss(pctx) != 0) return -1;
  return EVP_DigestVerify(mctx.get(), sig.data(), sig.size(), p, n) == 1 ? 0 : -1;
}

} // namespace enc

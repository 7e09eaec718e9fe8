#include <cstdio>
#include <cstring>
#include <openssl/crypto.h>

#include "blk/blocks.hpp"
#include "blk/pool.hpp"
#include "enc/kdf.hpp"
#include "util.hpp"

using namespace qeltrix;

namespace blk {

BlockKeys::~BlockKeys(){
  OPENSSL_cleanse(dek.data(), dek.size());
  OPENSSL_cleanse(nonce_base.data(), nonce_base.size());
}

int make_keys(const std::array<uint8_t,enc::KEY_SIZE>& dek, BlockKeys& out){
  out.dek = dek;
  return enc::derive_nonce_base(dek, out.nonce_base);
}

void make_aad(uint32_t idx, uint32_t pt_len, uint8_t aad[enc::AAD_LEN]){
  std::memcpy(aad, enc::MAGIC, 4);
  util::enc::put_be32(aad + 4, idx);
  util::enc::put_be32(aad + 8, pt_len);
}

int seal_block(const BlockKeys& k, enc::Cipher c, uint32_t idx, uint32_t pt_len,
               const std::vector<uint8_t>& comp, std::vector<uint8_t>& out){
  uint8_t nonce[enc::NONCE_SIZE];
  uint8_t aad[enc::AAD_LEN];
  enc::make_block_nonce(k.nonce_base, idx, nonce);
  make_aad(idx, pt_len, aad);

  out.resize(comp.size() + enc::TAG_SIZE);
  return enc::aead_seal(c, k.dek.data(), nonce, comp.data(), comp.size(),
                        aad, sizeof(aad), out.data(), out.data() + comp.size());
}

int open_block(const BlockKeys& k, enc::Cipher c, uint32_t idx, uint32_t pt_len,
               const uint8_t* ct, size_t ct_len, std::vector<uint8_t>& comp){
  if (ct_len < enc::TAG_SIZE) return -1;
  uint8_t nonce[enc::NONCE_SIZE];
  uint8_t aad[enc::AAD_LEN];
  enc::make_block_nonce(k.nonce_base, idx, nonce);
  make_aad(idx, pt_len, aad);

  size_t body = ct_len - enc::TAG_SIZE;
  comp.resize(body);
  if (enc::aead_open(c, k.dek.data(), nonce, ct, body, aad, sizeof(aad),
                     ct + body, comp.data()) != 0) {
    comp.clear();
    return -1;
  }
  return 0;
}

int compress_batch(const codec::Codec& cd, std::vector<Pending>& batch,
                   Pool& pool, uint32_t first_idx, ErrCtx& err){
  size_t bad = 0;
  int rc = pool.run(batch.size(), [&](size_t i){
    Pending& p = batch[i];
    if (cd.compress(p.raw.data(), p.raw.size(), p.comp) != 0) return E_CRYPTO;
    std::vector<uint8_t>().swap(p.raw);
    return 0;
  }, bad);
  if (rc != 0) {
    std::fprintf(stderr, "[BLOCK] %s compression failed at block %u\n", cd.name(), first_idx + (uint32_t)bad);
    return err.set(rc, "compress", first_idx + (int64_t)bad);
  }
  return 0;
}

int seal_batch(const BlockKeys& k, enc::Cipher c, std::vector<Pending>& batch,
               Pool& pool, uint32_t first_idx, ErrCtx& err){
  size_t bad = 0;
  int rc = pool.run(batch.size(), [&](size_t i){
    Pending& p = batch[i];
    if (seal_block(k, c, first_idx + (uint32_t)i, p.pt_len, p.comp, p.sealed) != 0) return E_CRYPTO;
    return 0;
  }, bad);
  if (rc != 0) {
    std::fprintf(stderr, "[BLOCK] seal failed at block %u\n", first_idx + (uint32_t)bad);
    return err.set(rc, "seal", first_idx + (int64_t)bad);
  }
  return 0;
}

int decode_range(int fd, uint64_t data_off, const enc::Metadata& md,
                 const codec::Codec& cd, const BlockKeys& k,
                 uint32_t first, uint32_t last, Pool& pool,
                 std::vector<Decoded>& out, ErrCtx& err){
  if (last < first || last >= md.blocks.size()) return err.set(E_FORMAT, "block range");

  size_t n = (size_t)(last - first) + 1;
  out.clear();
  out.resize(n);

  // per-worker failure detail, merged below
  std::vector<const char*> what(n, nullptr);
  size_t bad = 0;
  int rc = pool.run(n, [&](size_t i){
    const enc::BlockDesc& b = md.blocks[first + i];
    Decoded& d = out[i];

    std::vector<uint8_t> ct(b.ct_len);
    ssize_t got = util::fs::full_pread(fd, ct.data(), ct.size(), (off_t)(data_off + b.ct_off));
    if (got != (ssize_t)ct.size()) { what[i] = "read"; return E_IO; }

    if (open_block(k, md.cipher, b.index, b.pt_len, ct.data(), ct.size(), d.comp) != 0) {
      what[i] = "block tag";
      return E_INTEGRITY;
    }
    if (cd.decompress(d.comp.data(), d.comp.size(), b.pt_len, d.plain) != 0) {
      what[i] = "decompress";
      return E_INTEGRITY;
    }
    return 0;
  }, bad);

  if (rc != 0) {
    uint32_t idx = first + (uint32_t)bad;
    std::fprintf(stderr, "[BLOCK] %s failed at block %u\n", what[bad] ? what[bad] : "decode", idx);
    out.clear();
    return err.set(rc, what[bad] ? what[bad] : "decode", idx);
  }
  return 0;
}

bool resolve_range(const enc::Metadata& md, uint64_t off, uint64_t& len,
                   uint32_t& first, uint32_t& last){
  if (off >= md.total_len) { len = 0; return false; }
  if (len > md.total_len - off) len = md.total_len - off;
  if (len == 0) return false;

  // every block but the last holds exactly block_size bytes
  first = (uint32_t)(off / md.block_size);
  last  = (uint32_t)((off + len - 1) / md.block_size);
  return true;
}

} // namespace blk

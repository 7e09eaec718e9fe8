#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "blk/pool.hpp"
#include "codec/codec.hpp"
#include "enc/crypto.hpp"
#include "enc/meta.hpp"
#include "enc/params.hpp"
#include "qeltrix/err.hpp"

namespace blk {

// Read-only once built; shared by all workers
struct BlockKeys {
  std::array<uint8_t,enc::KEY_SIZE>   dek{};
  std::array<uint8_t,enc::NONCE_SIZE> nonce_base{};   // HKDF(dek)

  BlockKeys() = default;
  BlockKeys(const BlockKeys&) = delete;
  BlockKeys& operator=(const BlockKeys&) = delete;
  ~BlockKeys();
};

int make_keys(const std::array<uint8_t,enc::KEY_SIZE>& dek, BlockKeys& out);

// "QLTX" | be32(index) | be32(plain_len)
void make_aad(uint32_t idx, uint32_t pt_len, uint8_t aad[enc::AAD_LEN]);

// out = ciphertext | tag
int seal_block(const BlockKeys& k, enc::Cipher c, uint32_t idx, uint32_t pt_len,
               const std::vector<uint8_t>& comp, std::vector<uint8_t>& out);

// -1 when the tag does not verify
int open_block(const BlockKeys& k, enc::Cipher c, uint32_t idx, uint32_t pt_len,
               const uint8_t* ct, size_t ct_len, std::vector<uint8_t>& comp);

// A block travelling through the encode direction
struct Pending {
  uint32_t             pt_len{0};
  std::vector<uint8_t> raw;      // plaintext, dropped once compressed
  std::vector<uint8_t> comp;
  std::vector<uint8_t> sealed;
};

// Compress batch[i].raw into batch[i].comp in parallel
int compress_batch(const codec::Codec& cd, std::vector<Pending>& batch,
                   Pool& pool, uint32_t first_idx, qeltrix::ErrCtx& err);

// Seal batch[i].comp as block (first_idx + i) in parallel
int seal_batch(const BlockKeys& k, enc::Cipher c, std::vector<Pending>& batch,
               Pool& pool, uint32_t first_idx, qeltrix::ErrCtx& err);

// Decoded output of one block; slot i belongs to block first + i
struct Decoded {
  std::vector<uint8_t> comp;
  std::vector<uint8_t> plain;
};

// Read, open and decompress blocks [first, last] of the stream starting at
// data_off. Slots are index-partitioned; completion order does not matter.
int decode_range(int fd, uint64_t data_off, const enc::Metadata& md,
                 const codec::Codec& cd, const BlockKeys& k,
                 uint32_t first, uint32_t last, Pool& pool,
                 std::vector<Decoded>& out, qeltrix::ErrCtx& err);

// Clamp len to the stream end and find the blocks covering [off, off+len).
// false when the clamped request is empty.
bool resolve_range(const enc::Metadata& md, uint64_t off, uint64_t& len,
                   uint32_t& first, uint32_t& last);

} // namespace blk

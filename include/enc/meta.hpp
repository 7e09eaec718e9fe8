#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "params.hpp"
#include "crypto.hpp"
#include "codec/codec.hpp"

namespace enc {

enum class Mode : uint8_t { TWO_PASS = 0, SINGLE_PASS_FIRSTN = 1 };

const char* mode_name(Mode m);
int parse_mode(const std::string& name, Mode& out);

struct BlockDesc {
  uint32_t index{0};
  uint64_t ct_off{0};     // relative to the start of the block stream
  uint32_t ct_len{0};     // ciphertext + tag
  uint32_t pt_len{0};
};

// DEK wrapped under the recipient's public key
struct KeyEnvelope {
  std::string          recipient_id;
  std::vector<uint8_t> wrapped;
};

struct Signature {
  std::string          signer_id;
  std::vector<uint8_t> sig;
};

// Exactly one of embedded_key / envelope is set in a valid record.
struct Metadata {
  codec::Algo compression{codec::Algo::ZSTD};
  Cipher      cipher{Cipher::AES256_GCM};
  Mode        mode{Mode::TWO_PASS};
  uint32_t    block_size{DEFAULT_BLOCK};
  uint64_t    head_bytes{0};
  uint64_t    total_len{0};
  std::string mode_tag;                                   // MODE_TAG_LEN hex chars
  std::optional<std::array<uint8_t,KEY_SIZE>> embedded_key;
  std::optional<KeyEnvelope> envelope;
  std::vector<BlockDesc> blocks;
  std::optional<Signature> signature;
};

// Signed region: everything except the signature section.
int encode_body(const Metadata& md, std::vector<uint8_t>& out);

// signature section || body. The body runs from body_off to the end, so the
// signed region can be located without parsing it.
int encode_meta(const Metadata& md, std::vector<uint8_t>& out, size_t& body_off);

// Leading signature section only. -1 if it is truncated or malformed.
int decode_signature(const uint8_t* p, size_t n, std::optional<Signature>& sig, size_t& body_off);

// -1 on any structural problem (truncation, unknown id, trailing bytes, ...)
int decode_meta(const uint8_t* p, size_t n, Metadata& md, size_t& body_off);

// Block table invariants against the block stream length
int check_block_table(const Metadata& md, uint64_t stream_len);

uint64_t stream_len(const Metadata& md);

} // namespace enc

#include <cstdio>
#include <cstring>

#include "enc/meta.hpp"
#include "util.hpp"

using util::enc::get_be16;
using util::enc::get_be32;
using util::enc::get_be64;

namespace enc {

const char* mode_name(Mode m){
  switch (m){
    case Mode::TWO_PASS:           return "two_pass";
    case Mode::SINGLE_PASS_FIRSTN: return "single_pass_firstN";
  }
  return "?";
}

int parse_mode(const std::string& name, Mode& out){
  if (name == "two_pass")           { out = Mode::TWO_PASS; return 0; }
  if (name == "single_pass_firstN") { out = Mode::SINGLE_PASS_FIRSTN; return 0; }
  return -1;
}

namespace {

struct Out {
  std::vector<uint8_t>& v;

  void u8(uint8_t x){ v.push_back(x); }
  void u16(uint16_t x){ uint8_t b[2]; util::enc::put_be16(b, x); v.insert(v.end(), b, b+2); }
  void u32(uint32_t x){ uint8_t b[4]; util::enc::put_be32(b, x); v.insert(v.end(), b, b+4); }
  void u64(uint64_t x){ uint8_t b[8]; util::enc::put_be64(b, x); v.insert(v.end(), b, b+8); }
  void raw(const void* p, size_t n){
    const uint8_t* b = static_cast<const uint8_t*>(p);
    v.insert(v.end(), b, b+n);
  }
  void str16(const std::string& s){ u16((uint16_t)s.size()); raw(s.data(), s.size()); }
  void bytes32(const std::vector<uint8_t>& b){ u32((uint32_t)b.size()); raw(b.data(), b.size()); }
};

struct In {
  const uint8_t* p;
  size_t n;
  size_t pos{0};
  bool ok{true};

  bool need(size_t k){
    if (!ok || n - pos < k) { ok = false; return false; }
    return true;
  }
  uint8_t  u8(){  if (!need(1)) return 0; return p[pos++]; }
  uint16_t u16(){ if (!need(2)) return 0; uint16_t x = get_be16(p+pos); pos += 2; return x; }
  uint32_t u32(){ if (!need(4)) return 0; uint32_t x = get_be32(p+pos); pos += 4; return x; }
  uint64_t u64(){ if (!need(8)) return 0; uint64_t x = get_be64(p+pos); pos += 8; return x; }
  void raw(void* dst, size_t k){ if (!need(k)) return; std::memcpy(dst, p+pos, k); pos += k; }
  std::string str16(){
    uint16_t k = u16();
    if (!need(k)) return {};
    std::string s(reinterpret_cast<const char*>(p+pos), k);
    pos += k;
    return s;
  }
  std::vector<uint8_t> bytes32(){
    uint32_t k = u32();
    if (!need(k)) return {};
    std::vector<uint8_t> b(p+pos, p+pos+k);
    pos += k;
    return b;
  }
};

bool is_lower_hex(const std::string& s){
  for (char c : s)
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  return true;
}

constexpr uint8_t KEY_EMBEDDED = 0;
constexpr uint8_t KEY_ENVELOPE = 1;
constexpr size_t  BLOCK_DESC_SIZE = 4 + 8 + 4 + 4;

}

int encode_body(const Metadata& md, std::vector<uint8_t>& out){
  if (md.mode_tag.size() != MODE_TAG_LEN) return -1;
  if (md.embedded_key.has_value() == md.envelope.has_value()) return -1;
  if (md.envelope && (md.envelope->recipient_id.size() > 0xffff ||
                      md.envelope->wrapped.size() > 0xffffffffu)) return -1;
  if (md.blocks.size() > 0xffffffffu) return -1;

  out.clear();
  out.reserve(64 + MODE_TAG_LEN + md.blocks.size() * BLOCK_DESC_SIZE);
  Out w{out};
  w.u8(static_cast<uint8_t>(md.compression));
  w.u8(static_cast<uint8_t>(md.cipher));
  w.u8(static_cast<uint8_t>(md.mode));
  w.u32(md.block_size);
  w.u64(md.head_bytes);
  w.u64(md.total_len);
  w.raw(md.mode_tag.data(), MODE_TAG_LEN);
  if (md.envelope) {
    w.u8(KEY_ENVELOPE);
    w.str16(md.envelope->recipient_id);
    w.bytes32(md.envelope->wrapped);
  } else {
    w.u8(KEY_EMBEDDED);
    w.raw(md.embedded_key->data(), KEY_SIZE);
  }
  w.u32(static_cast<uint32_t>(md.blocks.size()));
  for (const auto& b : md.blocks) {
    w.u32(b.index);
    w.u64(b.ct_off);
    w.u32(b.ct_len);
    w.u32(b.pt_len);
  }
  return 0;
}

int encode_meta(const Metadata& md, std::vector<uint8_t>& out, size_t& body_off){
  std::vector<uint8_t> body;
  if (encode_body(md, body) != 0) return -1;

  out.clear();
  Out w{out};
  if (md.signature) {
    if (md.signature->signer_id.size() > 0xffff || md.signature->sig.empty()) return -1;
    w.u8(1);
    w.str16(md.signature->signer_id);
    w.bytes32(md.signature->sig);
  } else {
    w.u8(0);
  }
  body_off = out.size();
  w.raw(body.data(), body.size());
  return 0;
}

int decode_signature(const uint8_t* p, size_t n, std::optional<Signature>& sig, size_t& body_off){
  In r{p, n};
  sig.reset();
  uint8_t has_sig = r.u8();
  if (has_sig == 1) {
    Signature s;
    s.signer_id = r.str16();
    s.sig = r.bytes32();
    if (!r.ok || s.sig.empty()) return -1;
    sig = std::move(s);
  } else if (has_sig != 0 || !r.ok) {
    return -1;
  }
  body_off = r.pos;
  return 0;
}

int decode_meta(const uint8_t* p, size_t n, Metadata& md, size_t& body_off){
  md = Metadata{};
  if (decode_signature(p, n, md.signature, body_off) != 0) return -1;
  In r{p + body_off, n - body_off};

  uint8_t comp = r.u8();
  uint8_t ciph = r.u8();
  uint8_t mode = r.u8();
  if (!r.ok) return -1;
  if (!codec::algo_known(comp) || !cipher_known(ciph) ||
      mode > static_cast<uint8_t>(Mode::SINGLE_PASS_FIRSTN)) {
    std::fprintf(stderr, "[META] unknown id (compression=%u cipher=%u mode=%u)\n", comp, ciph, mode);
    return -1;
  }
  md.compression = static_cast<codec::Algo>(comp);
  md.cipher      = static_cast<Cipher>(ciph);
  md.mode        = static_cast<Mode>(mode);
  md.block_size  = r.u32();
  md.head_bytes  = r.u64();
  md.total_len   = r.u64();

  md.mode_tag.resize(MODE_TAG_LEN);
  r.raw(md.mode_tag.data(), MODE_TAG_LEN);
  if (!r.ok || !is_lower_hex(md.mode_tag)) return -1;

  uint8_t kind = r.u8();
  if (kind == KEY_EMBEDDED) {
    std::array<uint8_t,KEY_SIZE> k{};
    r.raw(k.data(), KEY_SIZE);
    md.embedded_key = k;
  } else if (kind == KEY_ENVELOPE) {
    KeyEnvelope env;
    env.recipient_id = r.str16();
    env.wrapped = r.bytes32();
    if (env.wrapped.empty()) return -1;
    md.envelope = std::move(env);
  } else {
    return -1;
  }

  uint32_t count = r.u32();
  if (!r.ok || (uint64_t)count * BLOCK_DESC_SIZE > r.n - r.pos) return -1;
  md.blocks.resize(count);
  for (auto& b : md.blocks) {
    b.index  = r.u32();
    b.ct_off = r.u64();
    b.ct_len = r.u32();
    b.pt_len = r.u32();
  }
  if (!r.ok || r.pos != r.n) return -1;   // trailing bytes
  return 0;
}

uint64_t stream_len(const Metadata& md){
  if (md.blocks.empty()) return 0;
  return md.blocks.back().ct_off + md.blocks.back().ct_len;
}

int check_block_table(const Metadata& md, uint64_t avail){
  if (md.block_size == 0 || md.block_size > MAX_BLOCK) return -1;
  if (md.mode == Mode::SINGLE_PASS_FIRSTN && md.head_bytes == 0) return -1;

  uint64_t ct_off = 0, pt_sum = 0;
  for (size_t i = 0; i < md.blocks.size(); i++) {
    const BlockDesc& b = md.blocks[i];
    if (b.index != i) return -1;
    if (b.ct_off != ct_off) return -1;
    if (b.ct_len < TAG_SIZE) return -1;
    if (b.pt_len == 0 || b.pt_len > md.block_size) return -1;
    if (i + 1 < md.blocks.size() && b.pt_len != md.block_size) return -1;
    ct_off += b.ct_len;
    pt_sum += b.pt_len;
  }
  if (pt_sum != md.total_len) return -1;
  if (ct_off > avail) return -1;
  return 0;
}

} // namespace enc

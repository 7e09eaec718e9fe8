#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "util.hpp"
#include "codec/codec.hpp"
#include "enc/asym.hpp"
#include "enc/crypto.hpp"
#include "enc/meta.hpp"
#include "qeltrix/cli.hpp"
#include "qeltrix/container.hpp"
#include "qeltrix/err.hpp"

using qeltrix::cli::Args;
using qeltrix::cli::parse_u64;

static void usage(const char* prog) {
  std::fprintf(stderr,
    "Usage:\n"
    "  %s pack   <in|-> <out> [--block-size N] [--compression none|zlib|lz4|zstd]\n"
    "            [--cipher aes256-gcm|chacha20-poly1305] [--mode two_pass|single_pass_firstN]\n"
    "            [--head-bytes N] [--pubkey PEM] [--signkey PEM] [--threads N]\n"
    "  %s unpack <in> <out> [--privkey PEM] [--verifykey PEM] [--threads N]\n"
    "  %s seek   <in> <offset> <length> [--privkey PEM] [--verifykey PEM] [--output FILE]\n"
    "  %s info   <in>\n"
    "  %s keygen <priv.pem> <pub.pem> [--bits N]\n",
    prog, prog, prog, prog, prog);
}

static bool load_pub(const char* path, enc::PKey& k) {
  return !path || enc::load_public_key(util::expand_args(path), k) == 0;
}

static bool load_priv(const char* path, enc::PKey& k) {
  return !path || enc::load_private_key(util::expand_args(path), k) == 0;
}

static bool read_threads(const Args& a, unsigned& threads) {
  threads = 0;
  if (const char* t = a.get("threads")) {
    uint64_t v = 0;
    if (!parse_u64(t, v) || v == 0 || v > 1024) {
      std::fprintf(stderr, "Invalid --threads '%s'\n", t);
      return false;
    }
    threads = static_cast<unsigned>(v);
  }
  return true;
}

static int report(const char* what, int rc, const qeltrix::ErrCtx& err) {
  if (rc == 0) return 0;
  if (err.block >= 0)
    std::fprintf(stderr, "%s failed: %s (%s, block %lld)\n", what, qeltrix::strerr(rc), err.check, (long long)err.block);
  else
    std::fprintf(stderr, "%s failed: %s (%s)\n", what, qeltrix::strerr(rc), err.check);
  return 2;
}

static int cmd_pack(const Args& a) {
  if (a.pos.size() != 2) return 1;
  qeltrix::PackOpts o;

  if (const char* v = a.get("block-size")) {
    uint64_t n = 0;
    if (!parse_u64(v, n) || n > 0xffffffffu) { std::fprintf(stderr, "Invalid --block-size '%s'\n", v); return 1; }
    o.block_size = static_cast<uint32_t>(n);
  }
  if (const char* v = a.get("head-bytes")) {
    if (!parse_u64(v, o.head_bytes)) { std::fprintf(stderr, "Invalid --head-bytes '%s'\n", v); return 1; }
  }
  if (const char* v = a.get("compression")) {
    if (codec::parse_algo(v, o.compression) != 0) { std::fprintf(stderr, "Unknown compression '%s'\n", v); return 1; }
  }
  if (const char* v = a.get("cipher")) {
    if (enc::parse_cipher(v, o.cipher) != 0) { std::fprintf(stderr, "Unknown cipher '%s'\n", v); return 1; }
  }
  if (const char* v = a.get("mode")) {
    if (enc::parse_mode(v, o.mode) != 0) { std::fprintf(stderr, "Unknown mode '%s'\n", v); return 1; }
  }
  if (!read_threads(a, o.threads)) return 1;

  enc::PKey pub, sign;
  if (!load_pub(a.get("pubkey"), pub) || !load_priv(a.get("signkey"), sign)) return 2;
  o.recipient = pub.get();
  o.signer = sign.get();

  qeltrix::ErrCtx err;
  int rc = qeltrix::pack(a.pos[0], a.pos[1], o, err);
  if (rc == 0)
    std::printf("Packed '%s' -> '%s' (%s, %s, %s%s%s)\n", a.pos[0].c_str(), a.pos[1].c_str(),
                codec::algo_name(o.compression), enc::cipher_name(o.cipher), enc::mode_name(o.mode),
                pub ? ", envelope" : "", sign ? ", signed" : "");
  return report("pack", rc, err);
}

static bool open_opts(const Args& a, qeltrix::OpenOpts& o, enc::PKey& priv, enc::PKey& verify) {
  if (!read_threads(a, o.threads)) return false;
  if (!load_priv(a.get("privkey"), priv) || !load_pub(a.get("verifykey"), verify)) return false;
  o.privkey = priv.get();
  o.verifykey = verify.get();
  return true;
}

static int cmd_unpack(const Args& a) {
  if (a.pos.size() != 2) return 1;
  qeltrix::OpenOpts o;
  enc::PKey priv, verify;
  if (!open_opts(a, o, priv, verify)) return 2;

  qeltrix::ErrCtx err;
  int rc = qeltrix::unpack(a.pos[0], a.pos[1], o, err);
  if (rc == 0) std::printf("Unpacked '%s' -> '%s'\n", a.pos[0].c_str(), a.pos[1].c_str());
  return report("unpack", rc, err);
}

static int cmd_seek(const Args& a) {
  if (a.pos.size() != 3) return 1;
  uint64_t off = 0, len = 0;
  if (!parse_u64(a.pos[1].c_str(), off) || !parse_u64(a.pos[2].c_str(), len)) {
    std::fprintf(stderr, "Invalid offset/length\n");
    return 1;
  }
  qeltrix::OpenOpts o;
  enc::PKey priv, verify;
  if (!open_opts(a, o, priv, verify)) return 2;

  const char* out = a.get("output");
  qeltrix::ErrCtx err;
  int rc = qeltrix::seek(a.pos[0], off, len, o, out ? out : "", err);
  return report("seek", rc, err);
}

static int cmd_info(const Args& a) {
  if (a.pos.size() != 1) return 1;
  qeltrix::Session s;
  int rc = qeltrix::inspect(a.pos[0], s);
  if (rc != 0) return report("info", rc, s.err);

  const enc::Metadata& md = s.md;
  std::printf("version      : %u.%u.%u\n", s.hdr.version[0], s.hdr.version[1], s.hdr.version[2]);
  std::printf("metadata     : %u bytes (signed region %zu)\n", enc::meta_len(s.hdr), s.meta_raw.size() - s.body_off);
  std::printf("compression  : %s\n", codec::algo_name(md.compression));
  std::printf("cipher       : %s\n", enc::cipher_name(md.cipher));
  std::printf("mode         : %s\n", enc::mode_name(md.mode));
  if (md.mode == enc::Mode::SINGLE_PASS_FIRSTN)
    std::printf("head bytes   : %llu\n", (unsigned long long)md.head_bytes);
  std::printf("block size   : %u\n", md.block_size);
  std::printf("total length : %llu\n", (unsigned long long)md.total_len);
  std::printf("blocks       : %zu (%llu ciphertext bytes)\n", md.blocks.size(),
              (unsigned long long)enc::stream_len(md));
  std::printf("mode_tag     : %s\n", md.mode_tag.c_str());
  if (md.envelope)
    std::printf("key          : envelope for %s\n", md.envelope->recipient_id.c_str());
  else
    std::printf("key          : embedded (no confidentiality)\n");
  if (md.signature)
    std::printf("signature    : by %s\n", md.signature->signer_id.c_str());
  else
    std::printf("signature    : none\n");
  return 0;
}

static int cmd_keygen(const Args& a) {
  if (a.pos.size() != 2) return 1;
  uint64_t bits = 2048;
  if (const char* v = a.get("bits")) {
    if (!parse_u64(v, bits) || bits < 2048 || bits > 16384) {
      std::fprintf(stderr, "Invalid --bits '%s' (2048..16384)\n", v);
      return 1;
    }
  }
  enc::PKey k;
  if (enc::generate_rsa(static_cast<unsigned>(bits), k) != 0 ||
      enc::write_private_pem(k.get(), util::expand_args(a.pos[0])) != 0 ||
      enc::write_public_pem(k.get(), util::expand_args(a.pos[1])) != 0) {
    std::fprintf(stderr, "keygen failed\n");
    return 2;
  }
  std::string id;
  if (enc::key_id(k.get(), id) == 0) std::printf("Key id %s\n", id.c_str());
  return 0;
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    usage(argv[0]);
    return 1;
  }

  std::string cmd = argv[1];
  Args a = qeltrix::cli::split_args(argc, argv, 2);
  if (a.bad) { usage(argv[0]); return 1; }

  int rc = 1;
  if (cmd == "pack")        rc = cmd_pack(a);
  else if (cmd == "unpack") rc = cmd_unpack(a);
  else if (cmd == "seek")   rc = cmd_seek(a);
  else if (cmd == "info")   rc = cmd_info(a);
  else if (cmd == "keygen") rc = cmd_keygen(a);

  if (rc == 1) usage(argv[0]);
  return rc;
}

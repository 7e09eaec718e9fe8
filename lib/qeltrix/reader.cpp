#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <openssl/crypto.h>
#include <sys/types.h>
#include <unistd.h>

#include "blk/blocks.hpp"
#include "enc/asym.hpp"
#include "enc/header.hpp"
#include "enc/kdf.hpp"
#include "enc/meta.hpp"
#include "qeltrix/container.hpp"
#include "util.hpp"

namespace qeltrix {

namespace {

constexpr size_t BATCH_PER_THREAD = 4;

int fail(const char* tag, ErrCtx& err){
  if (err.block >= 0)
    std::fprintf(stderr, "[%s] %s (%s, block %lld)\n", tag, strerr(err.code), err.check, (long long)err.block);
  else
    std::fprintf(stderr, "[%s] %s (%s)\n", tag, strerr(err.code), err.check);
  return err.code;
}

int verify_signature(Session& s, EVP_PKEY* verifykey){
  if (!s.md.signature) return s.err.set(E_SIGNATURE, "signature missing");

  std::string id;
  if (enc::key_id(verifykey, id) == 0 && id != s.md.signature->signer_id && util::debug())
    std::fprintf(stderr, "[UNPACK] verify key id %s differs from signer id %s\n",
                 id.c_str(), s.md.signature->signer_id.c_str());

  if (enc::verify_bytes(verifykey, s.meta_raw.data() + s.body_off, s.meta_raw.size() - s.body_off,
                        s.md.signature->sig) != 0)
    return s.err.set(E_SIGNATURE, "signature mismatch");
  return 0;
}

int obtain_key(Session& s, EVP_PKEY* privkey){
  std::array<uint8_t,enc::KEY_SIZE> dek{};
  if (s.md.envelope) {
    if (!privkey) return s.err.set(E_CONFIG, "private key required");
    if (enc::unwrap_key(privkey, s.md.envelope->wrapped, dek) != 0)
      return s.err.set(E_UNWRAP, "key envelope");
  } else {
    dek = *s.md.embedded_key;
  }

  int rc = 0;
  if (blk::make_keys(dek, s.keys) != 0) rc = s.err.set(E_CRYPTO, "nonce base");
  OPENSSL_cleanse(dek.data(), dek.size());
  return rc;
}

// Header, raw metadata and the leading signature section
int load_meta(const std::string& path, Session& s){
  s.fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (s.fd == -1) {
    std::fprintf(stderr, "[META] cannot open '%s': %s\n", path.c_str(), std::strerror(errno));
    return s.err.set(E_IO, "open container");
  }
  if (util::fs::file_size(s.fd, s.file_len) != 0) return s.err.set(E_IO, "stat container");

  switch (enc::read_header(s.fd, s.file_len, s.hdr)) {
    case 0: break;
    case -2: return s.err.set(E_FORMAT, "magic");
    case -3: return s.err.set(E_FORMAT, "version");
    case -4: return s.err.set(E_FORMAT, "metadata length");
    default: return s.err.set(E_FORMAT, "short header");
  }

  uint32_t L = enc::meta_len(s.hdr);
  s.meta_raw.resize(L);
  if (util::fs::full_pread(s.fd, s.meta_raw.data(), L, (off_t)enc::HEADER_SIZE) != (ssize_t)L)
    return s.err.set(E_IO, "read metadata");
  s.data_off = enc::HEADER_SIZE + (uint64_t)L;

  if (enc::decode_signature(s.meta_raw.data(), s.meta_raw.size(), s.md.signature, s.body_off) != 0)
    return s.err.set(E_FORMAT, "metadata structure");
  return 0;
}

// Body fields, block table and codec
int check_meta(Session& s){
  if (enc::decode_meta(s.meta_raw.data(), s.meta_raw.size(), s.md, s.body_off) != 0)
    return s.err.set(E_FORMAT, "metadata structure");
  if (enc::check_block_table(s.md, s.file_len - s.data_off) != 0)
    return s.err.set(E_FORMAT, "block table");

  s.codec = codec::make_codec(s.md.compression);
  if (!s.codec) return s.err.set(E_CONFIG, "compression id");
  return 0;
}

} // namespace

Session::~Session(){
  if (fd >= 0) close(fd);
  if (md.embedded_key) OPENSSL_cleanse(md.embedded_key->data(), enc::KEY_SIZE);
  if (!meta_raw.empty()) OPENSSL_cleanse(meta_raw.data(), meta_raw.size());
}

int inspect(const std::string& path, Session& s){
  int rc = load_meta(path, s);
  if (rc != 0) return rc;
  return check_meta(s);
}

int open_container(const std::string& path, const OpenOpts& opts, Session& s){
  s.threads = opts.threads ? opts.threads : util::default_threads();
  s.pool = std::make_unique<blk::Pool>(s.threads);

  int rc = load_meta(path, s);
  if (rc != 0) return rc;

  // the signature covers the raw body bytes, so it gates parsing them
  if (opts.verifykey) {
    if ((rc = verify_signature(s, opts.verifykey)) != 0) return rc;
  } else if (s.md.signature && util::debug()) {
    std::fprintf(stderr, "[UNPACK] signature present but not checked (no verify key)\n");
  }
  if ((rc = check_meta(s)) != 0) return rc;

  if ((rc = obtain_key(s, opts.privkey)) != 0) return rc;

  if (enc::check_mode_tag(s.md, s.keys.dek) != 0) return s.err.set(E_INTEGRITY, "mode_tag");
  s.keyed = true;
  return 0;
}

int read_range(Session& s, uint64_t off, uint64_t len, std::vector<uint8_t>& out){
  out.clear();
  if (!s.keyed) return s.err.set(E_CONFIG, "session not open");

  uint32_t first = 0, last = 0;
  if (!blk::resolve_range(s.md, off, len, first, last)) return 0;

  std::vector<blk::Decoded> dec;
  int rc = blk::decode_range(s.fd, s.data_off, s.md, *s.codec, s.keys, first, last,
                             *s.pool, dec, s.err);
  if (rc != 0) return rc;

  // reassemble in index order, then cut the request out
  uint64_t block_start = (uint64_t)first * s.md.block_size;
  uint64_t skip = off - block_start;
  out.reserve((size_t)len);
  for (auto& d : dec) {
    const uint8_t* p = d.plain.data();
    size_t n = d.plain.size();
    if (skip >= n) { skip -= n; continue; }
    p += skip; n -= (size_t)skip; skip = 0;
    size_t want = (size_t)std::min<uint64_t>(n, len - out.size());
    out.insert(out.end(), p, p + want);
    if (out.size() == len) break;
  }
  return 0;
}

int unpack(const std::string& src, const std::string& dest, const OpenOpts& opts, ErrCtx& err){
  Session s;
  int rc = open_container(src, opts, s);
  if (rc != 0) { err = s.err; return fail("UNPACK", err); }

  std::string tmp;
  int out_fd = util::fs::open_temp(dest, tmp);
  if (out_fd < 0) { err = s.err; err.set(E_IO, "open destination"); return fail("UNPACK", err); }

  // content binding: re-derive the DEK from the decrypted compressed stream
  enc::HeadHasher hasher(s.md.mode, s.md.head_bytes);

  size_t step = (size_t)s.threads * BATCH_PER_THREAD;
  uint64_t written = 0;
  for (size_t at = 0; at < s.md.blocks.size() && rc == 0; at += step) {
    uint32_t first = (uint32_t)at;
    uint32_t last  = (uint32_t)std::min(s.md.blocks.size() - 1, at + step - 1);
    std::vector<blk::Decoded> dec;
    rc = blk::decode_range(s.fd, s.data_off, s.md, *s.codec, s.keys, first, last,
                           *s.pool, dec, s.err);
    for (size_t i = 0; rc == 0 && i < dec.size(); i++) {
      hasher.update(dec[i].comp.data(), dec[i].comp.size());
      if (util::fs::full_pwrite(out_fd, dec[i].plain.data(), dec[i].plain.size(), (off_t)written) != (ssize_t)dec[i].plain.size())
        rc = s.err.set(E_IO, "write destination", first + (int64_t)i);
      written += dec[i].plain.size();
    }
  }

  if (rc == 0) {
    uint8_t digest[enc::DIGEST_SIZE];
    std::array<uint8_t,enc::KEY_SIZE> dek{};
    if (hasher.finish(digest) != 0 || enc::derive_dek(s.md.mode, digest, dek) != 0)
      rc = s.err.set(E_CRYPTO, "key derivation");
    else if (CRYPTO_memcmp(dek.data(), s.keys.dek.data(), dek.size()) != 0)
      rc = s.err.set(E_INTEGRITY, "content binding");
    OPENSSL_cleanse(dek.data(), dek.size());
  }

  if (rc != 0) {
    util::fs::discard_temp(out_fd, tmp);
    err = s.err;
    return fail("UNPACK", err);
  }
  if (util::fs::commit_temp(out_fd, tmp, dest) != 0) {
    err = s.err;
    err.set(E_IO, "finalize destination");
    return fail("UNPACK", err);
  }
  err = s.err;
  if (util::debug())
    std::fprintf(stderr, "[UNPACK] %s: %llu bytes from %zu blocks\n",
                 dest.c_str(), (unsigned long long)written, s.md.blocks.size());
  return 0;
}

int seek(const std::string& src, uint64_t off, uint64_t len, const OpenOpts& opts,
         const std::string& output, ErrCtx& err){
  Session s;
  int rc = open_container(src, opts, s);
  std::vector<uint8_t> data;
  if (rc == 0) rc = read_range(s, off, len, data);
  err = s.err;
  if (rc != 0) return fail("SEEK", err);

  if (output.empty()) {
    if (util::fs::full_write(STDOUT_FILENO, data.data(), data.size()) != (ssize_t)data.size()) {
      err.set(E_IO, "write stdout");
      return fail("SEEK", err);
    }
    return 0;
  }

  std::string tmp;
  int out_fd = util::fs::open_temp(output, tmp);
  if (out_fd < 0) { err.set(E_IO, "open output"); return fail("SEEK", err); }
  if (util::fs::full_pwrite(out_fd, data.data(), data.size(), 0) != (ssize_t)data.size()) {
    util::fs::discard_temp(out_fd, tmp);
    err.set(E_IO, "write output");
    return fail("SEEK", err);
  }
  if (util::fs::commit_temp(out_fd, tmp, output) != 0) {
    err.set(E_IO, "finalize output");
    return fail("SEEK", err);
  }
  if (util::debug())
    std::fprintf(stderr, "[SEEK] %llu bytes at offset %llu\n",
                 (unsigned long long)data.size(), (unsigned long long)off);
  return 0;
}

} // namespace qeltrix

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <openssl/crypto.h>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

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
constexpr size_t COPY_BUF = 1 << 20;

int check_opts(const PackOpts& o, ErrCtx& err){
  if (o.block_size == 0 || o.block_size > enc::MAX_BLOCK)
    return err.set(E_CONFIG, "block size");
  if (!codec::algo_known(static_cast<uint8_t>(o.compression)))
    return err.set(E_CONFIG, "compression id");
  if (!enc::cipher_known(static_cast<uint8_t>(o.cipher)))
    return err.set(E_CONFIG, "cipher id");
  if (o.mode != enc::Mode::TWO_PASS && o.mode != enc::Mode::SINGLE_PASS_FIRSTN)
    return err.set(E_CONFIG, "derivation mode");
  if (o.mode == enc::Mode::SINGLE_PASS_FIRSTN && o.head_bytes == 0)
    return err.set(E_CONFIG, "head bytes");
  if (o.recipient && EVP_PKEY_get_base_id(o.recipient) != EVP_PKEY_RSA)
    return err.set(E_CONFIG, "recipient key type");
  return 0;
}

// Blocks land here in index order while the metadata is still open.
struct Spool {
  int      fd{-1};
  uint64_t len{0};
  ~Spool(){ if (fd >= 0) close(fd); }
};

struct Packer {
  const PackOpts&               o;
  ErrCtx&                       err;
  unsigned                      threads;
  blk::Pool                     pool;
  std::unique_ptr<codec::Codec> cd;
  enc::HeadHasher               hasher;
  blk::BlockKeys                keys;
  bool                          keyed{false};
  std::vector<blk::Pending>     pending;   // compressed, waiting for the key
  enc::Metadata                 md;
  Spool                         spool;

  Packer(const PackOpts& opts, ErrCtx& e)
    : o(opts), err(e),
      threads(opts.threads ? opts.threads : util::default_threads()),
      pool(threads),
      cd(codec::make_codec(opts.compression)),
      hasher(opts.mode, opts.head_bytes) {}

  ~Packer(){
    if (md.embedded_key) OPENSSL_cleanse(md.embedded_key->data(), enc::KEY_SIZE);
  }

  int derive_key(){
    uint8_t digest[enc::DIGEST_SIZE];
    std::array<uint8_t,enc::KEY_SIZE> dek{};
    int rc = 0;
    if (hasher.finish(digest) != 0 || enc::derive_dek(o.mode, digest, dek) != 0 ||
        blk::make_keys(dek, keys) != 0) {
      rc = err.set(E_CRYPTO, "key derivation");
    }
    OPENSSL_cleanse(dek.data(), dek.size());
    OPENSSL_cleanse(digest, sizeof(digest));
    if (rc == 0) {
      keyed = true;
      if (util::debug())
        std::fprintf(stderr, "[PACK] %s key fixed after %llu compressed bytes\n",
                     enc::mode_name(o.mode), (unsigned long long)hasher.fed());
    }
    return rc;
  }

  // Seal everything pending and append it to the spool.
  int flush(){
    size_t step = (size_t)threads * BATCH_PER_THREAD;
    for (size_t at = 0; at < pending.size(); at += step) {
      size_t end = std::min(pending.size(), at + step);
      std::vector<blk::Pending> batch;
      batch.reserve(end - at);
      for (size_t i = at; i < end; i++) batch.push_back(std::move(pending[i]));

      uint32_t first = (uint32_t)md.blocks.size();
      int rc = blk::seal_batch(keys, o.cipher, batch, pool, first, err);
      if (rc != 0) return rc;

      for (auto& p : batch) {
        enc::BlockDesc d;
        d.index  = (uint32_t)md.blocks.size();
        d.ct_off = spool.len;
        d.ct_len = (uint32_t)p.sealed.size();
        d.pt_len = p.pt_len;
        if (util::fs::full_pwrite(spool.fd, p.sealed.data(), p.sealed.size(), (off_t)spool.len) != (ssize_t)p.sealed.size())
          return err.set(E_IO, "write block", d.index);
        spool.len += d.ct_len;
        md.blocks.push_back(d);
      }
    }
    pending.clear();
    return 0;
  }

  int run(int in_fd){
    size_t batch_n = (size_t)threads * BATCH_PER_THREAD;
    bool eof = false;

    while (!eof) {
      std::vector<blk::Pending> batch;
      batch.reserve(batch_n);
      while (batch.size() < batch_n) {
        blk::Pending p;
        p.raw.resize(o.block_size);
        ssize_t got = util::fs::full_read(in_fd, p.raw.data(), p.raw.size());
        if (got < 0) return err.set(E_IO, "read source");
        if (got == 0) { eof = true; break; }
        p.raw.resize((size_t)got);
        p.pt_len = (uint32_t)got;
        md.total_len += (uint64_t)got;
        batch.push_back(std::move(p));
        if ((size_t)got < o.block_size) { eof = true; break; }
      }
      if (batch.empty()) break;
      if (md.blocks.size() + pending.size() + batch.size() > 0xffffffffu)
        return err.set(E_CONFIG, "block count");

      uint32_t first = (uint32_t)(md.blocks.size() + pending.size());
      int rc = blk::compress_batch(*cd, batch, pool, first, err);
      if (rc != 0) return rc;

      for (auto& p : batch) {
        if (!keyed) hasher.update(p.comp.data(), p.comp.size());
        pending.push_back(std::move(p));
      }
      if (!keyed && o.mode == enc::Mode::SINGLE_PASS_FIRSTN && hasher.saturated()) {
        if ((rc = derive_key()) != 0) return rc;
      }
      if (keyed && (rc = flush()) != 0) return rc;
    }

    // two_pass always ends here; firstN when the stream is shorter than head_bytes
    int rc = 0;
    if (!keyed && (rc = derive_key()) != 0) return rc;
    return flush();
  }

  int build_meta(std::vector<uint8_t>& meta){
    md.compression = o.compression;
    md.cipher      = o.cipher;
    md.mode        = o.mode;
    md.block_size  = o.block_size;
    md.head_bytes  = o.mode == enc::Mode::SINGLE_PASS_FIRSTN ? o.head_bytes : 0;
    if (enc::compute_mode_tag(md, keys.dek, md.mode_tag) != 0)
      return err.set(E_CRYPTO, "mode_tag");

    if (o.recipient) {
      enc::KeyEnvelope env;
      if (enc::key_id(o.recipient, env.recipient_id) != 0 ||
          enc::wrap_key(o.recipient, keys.dek, env.wrapped) != 0)
        return err.set(E_CRYPTO, "wrap key");
      md.envelope = std::move(env);
    } else {
      md.embedded_key = keys.dek;
    }

    size_t body_off = 0;
    if (o.signer) {
      std::vector<uint8_t> body;
      if (enc::encode_body(md, body) != 0) return err.set(E_FORMAT, "encode metadata");
      enc::Signature s;
      if (enc::key_id(o.signer, s.signer_id) != 0 ||
          enc::sign_bytes(o.signer, body.data(), body.size(), s.sig) != 0)
        return err.set(E_CRYPTO, "sign metadata");
      md.signature = std::move(s);
    }
    if (enc::encode_meta(md, meta, body_off) != 0) return err.set(E_FORMAT, "encode metadata");
    if (meta.size() > enc::MAX_META) return err.set(E_FORMAT, "metadata size");
    return 0;
  }
};

int copy_range(int from, uint64_t from_off, int to, uint64_t to_off, uint64_t n){
  std::vector<uint8_t> buf((size_t)std::min<uint64_t>(n ? n : 1, COPY_BUF));
  uint64_t done = 0;
  while (done < n) {
    size_t k = (size_t)std::min<uint64_t>(buf.size(), n - done);
    if (util::fs::full_pread(from, buf.data(), k, (off_t)(from_off + done)) != (ssize_t)k) return -1;
    if (util::fs::full_pwrite(to, buf.data(), k, (off_t)(to_off + done)) != (ssize_t)k) return -1;
    done += k;
  }
  return 0;
}

}

int pack(const std::string& src, const std::string& dest, const PackOpts& opts, ErrCtx& err){
  int rc = check_opts(opts, err);
  if (rc != 0) {
    std::fprintf(stderr, "[PACK] rejected: %s\n", err.check);
    return rc;
  }

  Packer pk(opts, err);
  if (!pk.cd) return err.set(E_CONFIG, "compression id");

  int in_fd = STDIN_FILENO;
  if (src != "-") {
    in_fd = open(src.c_str(), O_RDONLY | O_CLOEXEC);
    if (in_fd == -1) {
      std::fprintf(stderr, "[PACK] cannot open '%s': %s\n", src.c_str(), std::strerror(errno));
      return err.set(E_IO, "open source");
    }
  }

  std::string spool_path;
  pk.spool.fd = util::fs::open_temp(dest + ".blocks", spool_path);
  if (pk.spool.fd < 0) {
    if (in_fd != STDIN_FILENO) close(in_fd);
    return err.set(E_IO, "open spool");
  }
  unlink(spool_path.c_str());

  rc = pk.run(in_fd);
  if (in_fd != STDIN_FILENO) close(in_fd);
  if (rc != 0) {
    std::fprintf(stderr, "[PACK] failed (%s: %s)\n", strerr(rc), err.check);
    return rc;
  }

  std::vector<uint8_t> meta;
  if ((rc = pk.build_meta(meta)) != 0) {
    std::fprintf(stderr, "[PACK] failed (%s: %s)\n", strerr(rc), err.check);
    return rc;
  }

  enc::Header h{};
  enc::make_header((uint32_t)meta.size(), h);

  std::string tmp;
  int out_fd = util::fs::open_temp(dest, tmp);
  if (out_fd < 0) return err.set(E_IO, "open destination");

  uint64_t data_off = enc::HEADER_SIZE + meta.size();
  if (enc::write_header(out_fd, h) != 0 ||
      util::fs::full_pwrite(out_fd, meta.data(), meta.size(), (off_t)enc::HEADER_SIZE) != (ssize_t)meta.size() ||
      copy_range(pk.spool.fd, 0, out_fd, data_off, pk.spool.len) != 0) {
    util::fs::discard_temp(out_fd, tmp);
    return err.set(E_IO, "write destination");
  }
  if (util::fs::commit_temp(out_fd, tmp, dest) != 0) return err.set(E_IO, "finalize destination");

  if (util::debug())
    std::fprintf(stderr, "[PACK] %s: %llu bytes, %zu blocks, meta %zu bytes, %s%s\n",
                 dest.c_str(), (unsigned long long)pk.md.total_len, pk.md.blocks.size(),
                 meta.size(), pk.md.envelope ? "envelope" : "embedded key",
                 pk.md.signature ? ", signed" : "");
  return 0;
}

} // namespace qeltrix

#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>

#include "blk/blocks.hpp"
#include "codec/codec.hpp"
#include "enc/header.hpp"
#include "enc/meta.hpp"
#include "enc/params.hpp"
#include "qeltrix/err.hpp"

namespace qeltrix {

// Keys are borrowed; the caller keeps them alive for the call.
struct PackOpts {
  uint32_t    block_size{enc::DEFAULT_BLOCK};
  codec::Algo compression{codec::Algo::ZSTD};
  enc::Cipher cipher{enc::Cipher::AES256_GCM};
  enc::Mode   mode{enc::Mode::TWO_PASS};
  uint64_t    head_bytes{enc::DEFAULT_HEAD};   // single_pass_firstN only
  EVP_PKEY*   recipient{nullptr};              // wrap the DEK
  EVP_PKEY*   signer{nullptr};                 // sign the metadata
  unsigned    threads{0};                      // 0: util::default_threads()
};

struct OpenOpts {
  EVP_PKEY* privkey{nullptr};     // required when the container has an envelope
  EVP_PKEY* verifykey{nullptr};   // when set, a valid signature is mandatory
  unsigned  threads{0};
};

// One open container. Owns the descriptor and the DEK.
struct Session {
  int                          fd{-1};
  uint64_t                     file_len{0};
  uint64_t                     data_off{0};   // start of the block stream
  enc::Header                  hdr{};
  enc::Metadata                md;
  std::vector<uint8_t>         meta_raw;
  size_t                       body_off{0};   // signed region is meta_raw[body_off, end)
  std::unique_ptr<codec::Codec> codec;
  blk::BlockKeys               keys;
  bool                         keyed{false};
  unsigned                     threads{1};
  std::unique_ptr<blk::Pool>   pool;          // created by open_container
  ErrCtx                       err;

  Session() = default;
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;
  ~Session();
};

// Writer
int pack(const std::string& src, const std::string& dest, const PackOpts& opts, ErrCtx& err);

// Header + metadata + block table only; no keys needed
int inspect(const std::string& path, Session& s);

// inspect, then signature check, key unwrap/rederivation and mode_tag check
int open_container(const std::string& path, const OpenOpts& opts, Session& s);

// Clamped random access read on an opened session
int read_range(Session& s, uint64_t off, uint64_t len, std::vector<uint8_t>& out);

int unpack(const std::string& src, const std::string& dest, const OpenOpts& opts, ErrCtx& err);

// Empty output path writes to stdout
int seek(const std::string& src, uint64_t off, uint64_t len, const OpenOpts& opts,
         const std::string& output, ErrCtx& err);

} // namespace qeltrix

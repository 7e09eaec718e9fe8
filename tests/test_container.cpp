#include <gtest/gtest.h>
#include <dirent.h>
#include <sys/stat.h>
#include <thread>
#include <algorithm>
#include <cstring>
#include <tuple>

#include "blk/blocks.hpp"
#include "enc/header.hpp"
#include "enc/kdf.hpp"
#include "qeltrix/container.hpp"
#include "test_util.hpp"

using namespace qeltrix;
using testutil::read_file;
using testutil::write_file;

class Container : public ::testing::Test {
protected:
  static enc::PKey recipient_, signer_, stranger_, ed_signer_;

  static void SetUpTestSuite() {
    recipient_ = testutil::rsa_key();
    signer_    = testutil::rsa_key();
    stranger_  = testutil::rsa_key();
    ed_signer_ = testutil::ed25519_key();
  }
  static void TearDownTestSuite() {
    recipient_.reset(); signer_.reset(); stranger_.reset(); ed_signer_.reset();
  }

  testutil::TempDir dir_;
  std::vector<uint8_t> payload_ = testutil::text_payload(30000);

  std::string pack_payload(const std::vector<uint8_t>& data, const PackOpts& o,
                           const std::string& name = "c.qltx") {
    std::string src = dir_.file(name + ".src");
    std::string dst = dir_.file(name);
    write_file(src, data);
    ErrCtx err;
    EXPECT_EQ(0, pack(src, dst, o, err)) << err.check;
    return dst;
  }

  int unpack_to(const std::string& c, const OpenOpts& o, std::vector<uint8_t>& out, ErrCtx& err) {
    std::string dst = dir_.file("out.bin");
    int rc = unpack(c, dst, o, err);
    if (rc == 0) out = read_file(dst);
    return rc;
  }

  std::vector<std::string> listing() {
    std::vector<std::string> names;
    if (DIR* d = opendir(dir_.path.c_str())) {
      while (dirent* e = readdir(d))
        if (e->d_name[0] != '.') names.emplace_back(e->d_name);
      closedir(d);
    }
    std::sort(names.begin(), names.end());
    return names;
  }
};

enc::PKey Container::recipient_;
enc::PKey Container::signer_;
enc::PKey Container::stranger_;
enc::PKey Container::ed_signer_;

// ---- round trips ----

using Combo = std::tuple<enc::Mode, codec::Algo, enc::Cipher>;
class RoundTrip : public Container, public ::testing::WithParamInterface<Combo> {};

TEST_P(RoundTrip, SymmetricRestoresPayload) {
  PackOpts o;
  std::tie(o.mode, o.compression, o.cipher) = GetParam();
  o.block_size = 1000;
  o.head_bytes = 700;
  o.threads = 3;

  for (auto data : {payload_, testutil::noise_payload(5001, 11)}) {
    std::string c = pack_payload(data, o);
    std::vector<uint8_t> out;
    ErrCtx err;
    ASSERT_EQ(0, unpack_to(c, OpenOpts{}, out, err)) << err.check;
    EXPECT_EQ(data, out);
  }
}

TEST_P(RoundTrip, EnvelopeAndSignatureRestorePayload) {
  PackOpts o;
  std::tie(o.mode, o.compression, o.cipher) = GetParam();
  o.block_size = 2048;
  o.head_bytes = 5 * 1024;
  o.recipient = recipient_.get();
  o.signer = signer_.get();

  std::string c = pack_payload(payload_, o);
  OpenOpts r;
  r.privkey = recipient_.get();
  r.verifykey = signer_.get();
  std::vector<uint8_t> out;
  ErrCtx err;
  ASSERT_EQ(0, unpack_to(c, r, out, err)) << err.check;
  EXPECT_EQ(payload_, out);
}

INSTANTIATE_TEST_SUITE_P(
  Modes, RoundTrip,
  ::testing::Combine(::testing::Values(enc::Mode::TWO_PASS, enc::Mode::SINGLE_PASS_FIRSTN),
                     ::testing::Values(codec::Algo::NONE, codec::Algo::ZLIB, codec::Algo::ZSTD,
                                       codec::Algo::LZ4),
                     ::testing::Values(enc::Cipher::AES256_GCM, enc::Cipher::CHACHA20_POLY1305)));

TEST_F(Container, AsymmetricSignedScenario) {
  PackOpts o;
  o.block_size = 1024;
  o.compression = codec::Algo::ZSTD;
  o.recipient = recipient_.get();
  o.signer = signer_.get();
  std::string c = pack_payload(payload_, o);

  OpenOpts good;
  good.privkey = recipient_.get();
  good.verifykey = signer_.get();
  std::vector<uint8_t> out;
  ErrCtx err;
  ASSERT_EQ(0, unpack_to(c, good, out, err));
  EXPECT_EQ(payload_, out);

  OpenOpts wrong = good;
  wrong.verifykey = stranger_.get();
  ErrCtx err2;
  std::string dst = dir_.file("rejected.bin");
  EXPECT_EQ(E_SIGNATURE, unpack(c, dst, wrong, err2));
  EXPECT_STREQ("signature mismatch", err2.check);
  EXPECT_FALSE(testutil::exists(dst));
}

TEST_F(Container, Ed25519Signature) {
  PackOpts o;
  o.block_size = 4096;
  o.signer = ed_signer_.get();
  std::string c = pack_payload(payload_, o);

  OpenOpts r;
  r.verifykey = ed_signer_.get();
  std::vector<uint8_t> out;
  ErrCtx err;
  ASSERT_EQ(0, unpack_to(c, r, out, err));
  EXPECT_EQ(payload_, out);

  r.verifykey = signer_.get();
  ErrCtx err2;
  EXPECT_EQ(E_SIGNATURE, unpack_to(c, r, out, err2));
}

TEST_F(Container, EmptyPayload) {
  std::string c = pack_payload({}, PackOpts{});
  Session s;
  ASSERT_EQ(0, inspect(c, s));
  EXPECT_EQ(0u, s.md.total_len);
  EXPECT_TRUE(s.md.blocks.empty());

  std::vector<uint8_t> out{1};
  ErrCtx err;
  ASSERT_EQ(0, unpack_to(c, OpenOpts{}, out, err));
  EXPECT_TRUE(out.empty());

  Session rs;
  ASSERT_EQ(0, open_container(c, OpenOpts{}, rs));
  ASSERT_EQ(0, read_range(rs, 0, 10, out));
  EXPECT_TRUE(out.empty());
}

TEST_F(Container, BlockSizeEqualToPayloadGivesOneBlock) {
  PackOpts o;
  o.block_size = (uint32_t)payload_.size();
  std::string c = pack_payload(payload_, o);
  Session s;
  ASSERT_EQ(0, inspect(c, s));
  ASSERT_EQ(1u, s.md.blocks.size());
  EXPECT_EQ(payload_.size(), s.md.blocks[0].pt_len);

  o.block_size = (uint32_t)payload_.size() - 1;
  Session s2;
  ASSERT_EQ(0, inspect(pack_payload(payload_, o, "two.qltx"), s2));
  EXPECT_EQ(2u, s2.md.blocks.size());
  EXPECT_EQ(1u, s2.md.blocks[1].pt_len);
}

// ---- seek ----

TEST_F(Container, SeekMatchesSlices) {
  for (bool asym : {false, true}) {
    PackOpts o;
    o.block_size = 1024;
    o.threads = 4;
    if (asym) o.recipient = recipient_.get();
    std::string c = pack_payload(payload_, o);

    OpenOpts r;
    if (asym) r.privkey = recipient_.get();
    Session s;
    ASSERT_EQ(0, open_container(c, r, s)) << s.err.check;

    const uint64_t total = payload_.size();
    const std::pair<uint64_t,uint64_t> cases[] = {
      {500, 1024}, {100, 2500}, {0, 1}, {1023, 2}, {1024, 1024},
      {9000, 3000}, {15000, 20000}, {total - 100, 500}, {total - 1, 1},
      {0, total}, {0, total + 1000}, {777, 0}, {total, 10}, {total + 5, 10},
    };
    for (auto& [off, len] : cases) {
      std::vector<uint8_t> got;
      ASSERT_EQ(0, read_range(s, off, len, got)) << off << "+" << len;
      uint64_t b = std::min(off, total), e = std::min(off + len, total);
      std::vector<uint8_t> want(payload_.begin() + b, payload_.begin() + e);
      EXPECT_EQ(want, got) << off << "+" << len;
    }
  }
}

TEST_F(Container, SeekWritesOutputFile) {
  PackOpts o;
  o.block_size = 10240;
  o.mode = enc::Mode::SINGLE_PASS_FIRSTN;
  o.head_bytes = 5 * 1024;
  std::string c = pack_payload(payload_, o);

  std::string out = dir_.file("seek.bin");
  ErrCtx err;
  ASSERT_EQ(0, seek(c, 9000, 3000, OpenOpts{}, out, err));
  std::vector<uint8_t> want(payload_.begin() + 9000, payload_.begin() + 12000);
  EXPECT_EQ(want, read_file(out));

  ASSERT_EQ(0, seek(c, payload_.size(), 100, OpenOpts{}, out, err));
  EXPECT_TRUE(read_file(out).empty());
}

TEST_F(Container, SeekInsideOneBlockTouchesOnlyThatBlock) {
  PackOpts o;
  o.block_size = 1024;
  o.compression = codec::Algo::NONE;
  std::string c = pack_payload(payload_, o);

  // corrupt block 5; reads elsewhere still work, reads through it fail
  Session probe;
  ASSERT_EQ(0, inspect(c, probe));
  uint64_t at = probe.data_off + probe.md.blocks[5].ct_off + 10;
  auto bytes = read_file(c);
  bytes[at] ^= 0x01;
  write_file(c, bytes);

  Session s;
  ASSERT_EQ(0, open_container(c, OpenOpts{}, s));
  std::vector<uint8_t> got;
  EXPECT_EQ(0, read_range(s, 2048, 1024, got));
  EXPECT_EQ(0, read_range(s, 6 * 1024, 100, got));
  EXPECT_EQ(E_INTEGRITY, read_range(s, 4000, 2000, got));
  EXPECT_EQ(5, s.err.block);
  EXPECT_STREQ("block tag", s.err.check);
  EXPECT_TRUE(got.empty());

  ErrCtx err;
  std::vector<uint8_t> out;
  EXPECT_EQ(E_INTEGRITY, unpack_to(c, OpenOpts{}, out, err));
  EXPECT_EQ(5, err.block);
}

// ---- tampering and keys ----

TEST_F(Container, EverySignedByteIsProtected) {
  PackOpts o;
  o.block_size = 8192;
  o.signer = signer_.get();
  std::string c = pack_payload(payload_, o);
  const auto orig = read_file(c);

  Session s;
  ASSERT_EQ(0, inspect(c, s));
  OpenOpts r;
  r.verifykey = signer_.get();
  r.threads = 1;

  // the signature is checked over raw bytes, so even flips that break the
  // body's framing surface as signature failures
  const size_t body_at = enc::HEADER_SIZE + s.body_off;
  const size_t body_n = s.meta_raw.size() - s.body_off;
  std::string t = dir_.file("t.qltx");
  for (size_t i = 0; i < body_n; i++) {
    auto bad = orig;
    bad[body_at + i] ^= 0x01;
    write_file(t, bad);
    ErrCtx err;
    std::vector<uint8_t> out;
    EXPECT_EQ(E_SIGNATURE, unpack_to(t, r, out, err)) << "byte " << i;
  }

  // same framing damage without a verify key is a format error
  const size_t count_at = body_at + 1 + 1 + 1 + 4 + 8 + 8 + enc::MODE_TAG_LEN + 1 + enc::KEY_SIZE;
  auto bad = orig;
  bad[count_at] ^= 0x80;
  write_file(t, bad);
  ErrCtx err;
  std::vector<uint8_t> out;
  EXPECT_EQ(E_FORMAT, unpack_to(t, OpenOpts{}, out, err));
  EXPECT_STREQ("metadata structure", err.check);
  ErrCtx err2;
  EXPECT_EQ(E_SIGNATURE, unpack_to(t, r, out, err2));
}

TEST_F(Container, ModeTagTamperDetected) {
  PackOpts o;
  o.block_size = 1024;
  o.recipient = recipient_.get();
  o.signer = signer_.get();
  std::string c = pack_payload(payload_, o);
  Session probe;
  ASSERT_EQ(0, inspect(c, probe));

  // mode_tag sits after compression, cipher, mode, block_size, head_bytes, total_len
  const size_t tag_at = enc::HEADER_SIZE + probe.body_off + 1 + 1 + 1 + 4 + 8 + 8;
  auto bytes = read_file(c);
  bytes[tag_at] = bytes[tag_at] == 'a' ? 'b' : 'a';
  std::string t = dir_.file("tampered.qltx");
  write_file(t, bytes);

  OpenOpts r;
  r.privkey = recipient_.get();
  r.verifykey = signer_.get();
  std::vector<uint8_t> out;
  ErrCtx e1;
  EXPECT_EQ(E_SIGNATURE, unpack_to(t, r, out, e1));

  // without signature checking the mode_tag still stops it before any block
  r.verifykey = nullptr;
  ErrCtx e2;
  EXPECT_EQ(E_INTEGRITY, unpack_to(t, r, out, e2));
  EXPECT_STREQ("mode_tag", e2.check);
  EXPECT_EQ(-1, e2.block);
}

TEST_F(Container, WrongOrMissingPrivateKey) {
  PackOpts o;
  o.recipient = recipient_.get();
  std::string c = pack_payload(payload_, o);

  OpenOpts r;
  std::vector<uint8_t> out;
  ErrCtx e1;
  EXPECT_EQ(E_CONFIG, unpack_to(c, r, out, e1));

  r.privkey = stranger_.get();
  ErrCtx e2;
  EXPECT_EQ(E_UNWRAP, unpack_to(c, r, out, e2));

  ErrCtx e3;
  EXPECT_EQ(E_UNWRAP, seek(c, 0, 10, r, dir_.file("s.bin"), e3));
}

TEST_F(Container, VerifyKeyWithoutSignature) {
  std::string c = pack_payload(payload_, PackOpts{});
  OpenOpts r;
  r.verifykey = signer_.get();
  std::vector<uint8_t> out;
  ErrCtx err;
  EXPECT_EQ(E_SIGNATURE, unpack_to(c, r, out, err));
  EXPECT_STREQ("signature missing", err.check);

  // signature present, no verify key: not checked
  PackOpts s;
  s.signer = signer_.get();
  std::string c2 = pack_payload(payload_, s, "signed.qltx");
  ErrCtx err2;
  ASSERT_EQ(0, unpack_to(c2, OpenOpts{}, out, err2));
  EXPECT_EQ(payload_, out);
}

TEST_F(Container, FormatErrors) {
  std::string c = pack_payload(payload_, PackOpts{});
  auto orig = read_file(c);
  std::string t = dir_.file("bad.qltx");
  std::vector<uint8_t> out;

  auto expect_format = [&](std::vector<uint8_t> bytes, const char* check) {
    write_file(t, bytes);
    ErrCtx err;
    EXPECT_EQ(E_FORMAT, unpack_to(t, OpenOpts{}, out, err)) << check;
    EXPECT_STREQ(check, err.check);
  };

  auto magic = orig; magic[1] = 'X';
  expect_format(magic, "magic");
  auto version = orig; version[4] = 9;
  expect_format(version, "version");
  auto longer = orig; longer[10] = 0x7f;
  expect_format(longer, "metadata length");
  auto cut = orig; cut.resize(orig.size() - 1);
  expect_format(cut, "block table");
  expect_format(std::vector<uint8_t>(orig.begin(), orig.begin() + 5), "short header");

  // L one byte short of the real metadata
  Session s;
  ASSERT_EQ(0, inspect(c, s));
  auto shorter = orig;
  uint32_t L = enc::meta_len(s.hdr) - 1;
  shorter[10] = (uint8_t)(L >> 24); shorter[11] = (uint8_t)(L >> 16);
  shorter[12] = (uint8_t)(L >> 8);  shorter[13] = (uint8_t)L;
  expect_format(shorter, "metadata structure");
}

TEST_F(Container, ConfigurationRejectedBeforeIo) {
  std::string src = dir_.file("in.bin");
  write_file(src, payload_);
  std::string dst = dir_.file("never.qltx");

  PackOpts zero;
  zero.block_size = 0;
  ErrCtx e1;
  EXPECT_EQ(E_CONFIG, pack(src, dst, zero, e1));
  EXPECT_STREQ("block size", e1.check);

  PackOpts head;
  head.mode = enc::Mode::SINGLE_PASS_FIRSTN;
  head.head_bytes = 0;
  ErrCtx e2;
  EXPECT_EQ(E_CONFIG, pack(src, dst, head, e2));

  PackOpts ed;
  ed.recipient = ed_signer_.get();
  ErrCtx e3;
  EXPECT_EQ(E_CONFIG, pack(src, dst, ed, e3));

  PackOpts bogus;
  bogus.compression = static_cast<codec::Algo>(7);
  ErrCtx e4;
  EXPECT_EQ(E_CONFIG, pack(dir_.file("missing"), dst, bogus, e4));

  EXPECT_FALSE(testutil::exists(dst));
  EXPECT_EQ((std::vector<std::string>{"in.bin"}), listing());
}

TEST_F(Container, MissingSourceIsIoError) {
  ErrCtx err;
  EXPECT_EQ(E_IO, pack(dir_.file("nope"), dir_.file("x.qltx"), PackOpts{}, err));
  EXPECT_TRUE(listing().empty());
}

// ---- derivation properties ----

TEST_F(Container, SymmetricPackIsDeterministic) {
  PackOpts o;
  o.block_size = 1500;
  o.threads = 2;
  auto a = read_file(pack_payload(payload_, o, "a.qltx"));
  o.threads = 7;
  auto b = read_file(pack_payload(payload_, o, "b.qltx"));
  EXPECT_EQ(a, b);
}

TEST_F(Container, FirstNKeyIgnoresTail) {
  auto x = testutil::noise_payload(20000, 21);
  auto y = x;
  y[15000] ^= 0xff;

  for (auto mode : {enc::Mode::SINGLE_PASS_FIRSTN, enc::Mode::TWO_PASS}) {
    PackOpts o;
    o.block_size = 4096;
    o.mode = mode;
    o.head_bytes = 4096;
    Session sx, sy;
    ASSERT_EQ(0, inspect(pack_payload(x, o, "x.qltx"), sx));
    ASSERT_EQ(0, inspect(pack_payload(y, o, "y.qltx"), sy));
    if (mode == enc::Mode::SINGLE_PASS_FIRSTN) {
      EXPECT_EQ(*sx.md.embedded_key, *sy.md.embedded_key);
      EXPECT_EQ(sx.md.mode_tag, sy.md.mode_tag);
    } else {
      EXPECT_NE(*sx.md.embedded_key, *sy.md.embedded_key);
    }
  }
}

TEST_F(Container, ContentBindingCheckedOnFullUnpack) {
  PackOpts o;
  o.block_size = 4096;
  o.compression = codec::Algo::ZLIB;
  std::string c = pack_payload(payload_, o);

  // Re-key the container consistently with a DEK that is not content-derived:
  // every per-block and metadata check passes, only the binding does not.
  Session s;
  ASSERT_EQ(0, open_container(c, OpenOpts{}, s));
  std::array<uint8_t,enc::KEY_SIZE> fake{};
  fake.fill(0x33);
  blk::BlockKeys fk;
  ASSERT_EQ(0, blk::make_keys(fake, fk));

  enc::Metadata md = s.md;
  std::vector<uint8_t> stream;
  ASSERT_FALSE(md.blocks.empty());
  std::vector<blk::Decoded> dec;
  ASSERT_EQ(0, blk::decode_range(s.fd, s.data_off, s.md, *s.codec, s.keys, 0,
                                 (uint32_t)s.md.blocks.size() - 1, *s.pool, dec, s.err));
  for (size_t i = 0; i < dec.size(); i++) {
    std::vector<uint8_t> sealed;
    ASSERT_EQ(0, blk::seal_block(fk, md.cipher, (uint32_t)i, md.blocks[i].pt_len, dec[i].comp, sealed));
    stream.insert(stream.end(), sealed.begin(), sealed.end());
  }
  md.embedded_key = fake;
  ASSERT_EQ(0, enc::compute_mode_tag(md, fake, md.mode_tag));
  std::vector<uint8_t> meta;
  size_t body_off = 0;
  ASSERT_EQ(0, enc::encode_meta(md, meta, body_off));

  enc::Header h{};
  enc::make_header((uint32_t)meta.size(), h);
  std::vector<uint8_t> file(reinterpret_cast<uint8_t*>(&h), reinterpret_cast<uint8_t*>(&h) + sizeof(h));
  file.insert(file.end(), meta.begin(), meta.end());
  file.insert(file.end(), stream.begin(), stream.end());
  std::string t = dir_.file("rekeyed.qltx");
  write_file(t, file);

  Session rs;
  ASSERT_EQ(0, open_container(t, OpenOpts{}, rs));
  std::vector<uint8_t> got;
  ASSERT_EQ(0, read_range(rs, 100, 5000, got));
  EXPECT_EQ(std::vector<uint8_t>(payload_.begin() + 100, payload_.begin() + 5100), got);

  ErrCtx err;
  std::string dst = dir_.file("out.bin");
  EXPECT_EQ(E_INTEGRITY, unpack(t, dst, OpenOpts{}, err));
  EXPECT_STREQ("content binding", err.check);
  EXPECT_FALSE(testutil::exists(dst));
}

TEST_F(Container, FailedUnpackLeavesNoFiles) {
  PackOpts o;
  o.block_size = 1024;
  std::string c = pack_payload(payload_, o);
  Session probe;
  ASSERT_EQ(0, inspect(c, probe));
  auto bytes = read_file(c);
  bytes[probe.data_off + probe.md.blocks.back().ct_off] ^= 0x10;   // last block
  write_file(c, bytes);

  auto before = listing();
  OpenOpts r;
  r.threads = 1;
  ErrCtx err;
  EXPECT_EQ(E_INTEGRITY, unpack(c, dir_.file("out.bin"), r, err));
  EXPECT_EQ((int64_t)probe.md.blocks.size() - 1, err.block);
  EXPECT_EQ(before, listing());
}

TEST_F(Container, ConcurrentCallersGetUmaskedOutputs) {
  mode_t old = umask(027);
  PackOpts o;
  o.block_size = 2048;
  o.threads = 2;
  std::string c = pack_payload(payload_, o);

  std::vector<int> rcs(4, -100);
  std::vector<std::thread> callers;
  for (int t = 0; t < 4; t++) {
    callers.emplace_back([&, t]{
      ErrCtx err;
      OpenOpts r;
      r.threads = 2;
      rcs[t] = unpack(c, dir_.file("out" + std::to_string(t) + ".bin"), r, err);
    });
  }
  for (auto& th : callers) th.join();
  umask(old);

  struct stat st{};
  ASSERT_EQ(0, stat(c.c_str(), &st));
  EXPECT_EQ(0640u, st.st_mode & 0777);
  for (int t = 0; t < 4; t++) {
    std::string out = dir_.file("out" + std::to_string(t) + ".bin");
    ASSERT_EQ(0, rcs[t]);
    EXPECT_EQ(payload_, read_file(out));
    ASSERT_EQ(0, stat(out.c_str(), &st));
    EXPECT_EQ(0640u, st.st_mode & 0777);
  }
  for (auto& name : listing()) EXPECT_EQ(std::string::npos, name.find(".tmp.")) << name;
}

#include <gtest/gtest.h>

#include "qeltrix/cli.hpp"

using qeltrix::cli::Args;
using qeltrix::cli::parse_u64;
using qeltrix::cli::split_args;

namespace {

Args split(std::vector<const char*> v) {
  return split_args(static_cast<int>(v.size()), v.data(), 2);
}

}

TEST(Cli, FlagWithSeparateValue) {
  Args a = split({"qltx", "pack", "in", "out", "--block-size", "1024", "--mode", "two_pass"});
  EXPECT_FALSE(a.bad);
  EXPECT_EQ((std::vector<std::string>{"in", "out"}), a.pos);
  EXPECT_STREQ("1024", a.get("block-size"));
  EXPECT_STREQ("two_pass", a.get("mode"));
  EXPECT_EQ(nullptr, a.get("cipher"));
}

TEST(Cli, FlagWithEqualsValue) {
  Args a = split({"qltx", "pack", "--block-size=1024", "in", "--output=a=b", "out", "--pubkey="});
  EXPECT_FALSE(a.bad);
  EXPECT_EQ((std::vector<std::string>{"in", "out"}), a.pos);
  EXPECT_STREQ("1024", a.get("block-size"));
  EXPECT_STREQ("a=b", a.get("output"));
  ASSERT_NE(nullptr, a.get("pubkey"));
  EXPECT_STREQ("", a.get("pubkey"));
}

TEST(Cli, LastOccurrenceWins) {
  Args a = split({"qltx", "unpack", "--threads", "2", "--threads=8"});
  EXPECT_STREQ("8", a.get("threads"));
}

TEST(Cli, TrailingFlagWithoutValue) {
  Args a = split({"qltx", "unpack", "in", "out", "--privkey"});
  EXPECT_TRUE(a.bad);
  EXPECT_EQ(nullptr, a.get("privkey"));
}

TEST(Cli, DashesAloneArePositional) {
  Args a = split({"qltx", "pack", "-", "--", "out"});
  EXPECT_EQ((std::vector<std::string>{"-", "--", "out"}), a.pos);
}

TEST(Cli, ParseUnsigned) {
  uint64_t v = 0;
  EXPECT_TRUE(parse_u64("0", v));
  EXPECT_EQ(0u, v);
  EXPECT_TRUE(parse_u64("18446744073709551615", v));
  EXPECT_EQ(UINT64_MAX, v);
  EXPECT_FALSE(parse_u64("18446744073709551616", v));
  EXPECT_FALSE(parse_u64("-1", v));
  EXPECT_FALSE(parse_u64("+1", v));
  EXPECT_FALSE(parse_u64("12k", v));
  EXPECT_FALSE(parse_u64("", v));
  EXPECT_FALSE(parse_u64(nullptr, v));
}

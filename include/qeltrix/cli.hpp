#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace qeltrix::cli {

// Positionals plus --flag value / --flag=value pairs
struct Args {
  std::vector<std::string> pos;
  std::vector<std::pair<std::string,std::string>> flags;
  bool bad = false;   // a trailing --flag had no value

  // Last occurrence wins
  const char* get(const char* name) const;
};

Args split_args(int argc, const char* const argv[], int from);

// Decimal, no sign, no trailing garbage
bool parse_u64(const char* s, uint64_t& out);

} // namespace qeltrix::cli

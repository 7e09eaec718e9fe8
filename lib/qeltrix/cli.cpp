#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "qeltrix/cli.hpp"

namespace qeltrix::cli {

const char* Args::get(const char* name) const {
  const char* v = nullptr;
  for (auto& f : flags) if (f.first == name) v = f.second.c_str();
  return v;
}

Args split_args(int argc, const char* const argv[], int from){
  Args a;
  int i = from;
  while (i < argc) {
    const char* s = argv[i];
    if (std::strncmp(s, "--", 2) == 0 && s[2] != '\0') {
      const char* name = s + 2;
      const char* eq = std::strchr(name, '=');
      if (eq) {
        a.flags.emplace_back(std::string(name, static_cast<size_t>(eq - name)), std::string(eq + 1));
        ++i;
      } else if (i + 1 < argc) {
        a.flags.emplace_back(std::string(name), std::string(argv[i + 1]));
        i += 2;
      } else {
        std::fprintf(stderr, "Missing value for %s\n", s);
        a.bad = true;
        ++i;
      }
    } else {
      a.pos.emplace_back(s);
      ++i;
    }
  }
  return a;
}

bool parse_u64(const char* s, uint64_t& out){
  if (!s || !*s || *s == '-' || *s == '+') return false;
  char* end = nullptr;
  errno = 0;
  unsigned long long v = std::strtoull(s, &end, 10);
  if (errno != 0 || *end != '\0') return false;
  out = v;
  return true;
}

} // namespace qeltrix::cli

#include "cstfs/time.hpp"

#include <cstdio>

namespace cstfs::timeutil {

std::string format_elapsed(clock::duration elapsed) {
  const double secs = std::chrono::duration<double>(elapsed).count();
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2fs", secs);
  return std::string(buf);
}

std::string elapsed_since(clock::time_point start) { return format_elapsed(clock::now() - start); }

} // namespace cstfs::timeutil

// String and digest helpers
#include "cstfs/util.hpp"

#include "cstfs/consts.hpp"

#include <algorithm>
#include <cctype>

namespace cstfs {

bool looks_hex16(std::string_view str) {
  if (str.size() != consts::kDigestHexLen) {
    return false;
  }
  return std::ranges::all_of(str, [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
}

namespace strutil {

std::string trim(std::string_view sv) {
  auto is_ws = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!sv.empty() && is_ws(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && is_ws(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::string to_lower(std::string_view sv) {
  std::string s(sv);
  std::ranges::transform(s, s.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace strutil

} // namespace cstfs

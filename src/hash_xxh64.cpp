#include "cstfs/hash.hpp"
#include "cstfs/consts.hpp"
#include "cstfs/fs.hpp"

#include <array>
#include <xxhash.h>

namespace cstfs {

digest xxh64(std::span<const std::uint8_t> data) {
  return static_cast<digest>(XXH64(data.data(), data.size(), consts::kDigestSeed));
}

std::string to_hex(digest d) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s(consts::kDigestHexLen, '0');
  for (std::size_t i = consts::kDigestHexLen; i-- > 0;) {
    s[i] = kHex[d & 0xF];
    d >>= 4;
  }
  return s;
}

std::string hash_file(const std::filesystem::path &path) {
  const fs::MappedFile file{path};
  return to_hex(xxh64(file.bytes()));
}

} // namespace cstfs

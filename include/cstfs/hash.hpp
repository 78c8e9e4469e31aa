#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace cstfs {

// 64-bit content digest (XXH64, seed 0).
//
// XXH64 is a fast non-cryptographic hash. Two unrelated files colliding is
// possible in theory and accepted: the index trades collision resistance for
// scanning throughput. Do not read a matching digest as proof against
// deliberately crafted input.
using digest = std::uint64_t;

digest xxh64(std::span<const std::uint8_t> data);

inline digest xxh64(std::string_view s) {
  return xxh64(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert a digest to 16-char zero-padded lowercase hex. */
std::string to_hex(digest d);

/**
 * Digest of the full contents of `path`, as hex.
 * The file is memory mapped, not copied. Throws IoError when the file cannot
 * be opened or mapped (vanished, permission denied, ...).
 */
std::string hash_file(const std::filesystem::path &path);

} // namespace cstfs

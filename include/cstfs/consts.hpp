#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace cstfs::consts {

// File names inside the indexed root
inline constexpr std::string_view kDefaultDbName = "cstfs.db";
inline constexpr std::string_view kConfigFile    = "cstfs.conf";

// ——— Digest sizes ———
inline constexpr std::size_t kDigestHexLen = 16; // 64-bit XXH64, zero-padded lowercase hex
inline constexpr std::uint64_t kDigestSeed = 0;

// ——— Config keys ———
inline constexpr std::string_view kKeyDb         = "db:";
inline constexpr std::string_view kKeyExtensions = "extensions:";

// ——— Default media allow-list (lowercase, no dot) ———
inline constexpr std::array<std::string_view, 32> kMediaExtensions = {
    // images
    "jpg", "jpeg", "png", "gif", "bmp", "tif", "tiff", "webp", "heic", "heif", "raw", "cr2",
    "nef", "arw", "dng",
    // audio
    "mp3", "flac", "wav", "ogg", "m4a", "aac", "opus",
    // video
    "mp4", "mov", "avi", "mkv", "webm", "m4v", "mpg", "mpeg", "3gp", "wmv"};

// ——— Duplicate prompt ———
inline constexpr std::string_view kValidCommands = "Y/n/s/o/?";

} // namespace cstfs::consts

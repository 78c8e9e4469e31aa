#include "cstfs/error.hpp"
#include "cstfs/hash.hpp"
#include "cstfs/util.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("cstfs_hash_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    // hex formatting is fixed-width and zero padded
    if (cstfs::to_hex(0) != "0000000000000000") {
      std::cerr << "to_hex(0) not padded: " << cstfs::to_hex(0) << "\n";
      return 1;
    }
    if (cstfs::to_hex(0xABCDEFULL) != "0000000000abcdef") {
      std::cerr << "to_hex not lowercase/padded\n";
      return 1;
    }

    write_file(root / "a.jpg", "hello\n");
    write_file(root / "b.jpg", "hello\n");
    write_file(root / "c.jpg", "hello!\n");
    write_file(root / "empty.jpg", "");

    const auto ha = cstfs::hash_file(root / "a.jpg");
    if (!cstfs::looks_hex16(ha)) {
      std::cerr << "digest is not 16 lowercase hex: " << ha << "\n";
      return 1;
    }
    if (ha != cstfs::to_hex(cstfs::xxh64(std::string_view("hello\n")))) {
      std::cerr << "mapped digest differs from in-memory digest\n";
      return 1;
    }
    if (ha != cstfs::hash_file(root / "b.jpg")) {
      std::cerr << "same content, different digest\n";
      return 1;
    }
    if (ha == cstfs::hash_file(root / "c.jpg")) {
      std::cerr << "different content, same digest\n";
      return 1;
    }
    if (cstfs::hash_file(root / "empty.jpg") != cstfs::to_hex(cstfs::xxh64(std::string_view{}))) {
      std::cerr << "empty file digest mismatch\n";
      return 1;
    }

    bool threw = false;
    try {
      (void)cstfs::hash_file(root / "missing.jpg");
    } catch (const cstfs::IoError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "hashing a missing file did not throw IoError\n";
      return 1;
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}

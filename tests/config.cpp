#include "cstfs/config.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("cstfs_config_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    // No cstfs.conf => defaults
    const auto def = cstfs::load_config(root);
    if (def.db_name != "cstfs.db" || cstfs::db_path(def) != root / "cstfs.db") {
      std::cerr << "default db location mismatch\n";
      return 1;
    }
    for (const char *ext : {"jpg", "png", "mp3", "flac", "mp4", "mkv"}) {
      if (!def.extensions.contains(ext)) {
        std::cerr << "default allow-list misses " << ext << "\n";
        return 1;
      }
    }
    if (def.extensions.contains("txt")) {
      std::cerr << "txt should not be media\n";
      return 1;
    }

    // Overrides
    {
      std::ofstream conf(root / "cstfs.conf");
      conf << "# local settings\n"
           << "\n"
           << "db: photos.db\n"
           << "extensions: JPG, .png ,raw\n"
           << "colour: blue\n";
    }
    const auto cfg = cstfs::load_config(root);
    if (cfg.db_name != "photos.db" || cstfs::db_path(cfg) != root / "photos.db") {
      std::cerr << "db override not applied: " << cfg.db_name << "\n";
      return 1;
    }
    if (cfg.extensions != std::set<std::string>{"jpg", "png", "raw"}) {
      std::cerr << "extensions override not applied\n";
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

#pragma once
#include <filesystem>
#include <set>
#include <string>

namespace cstfs {

struct Config {
  std::filesystem::path root;           // indexed directory
  std::string db_name;                  // index file name inside root
  std::set<std::string> extensions;     // lowercase, no leading dot
};

// Defaults for `root`: "cstfs.db" and the built-in media allow-list
auto default_config(const std::filesystem::path &root) -> Config;

// Defaults overridden by root/cstfs.conf when present
auto load_config(const std::filesystem::path &root) -> Config;

// Location of the index file for this configuration
auto db_path(const Config &cfg) -> std::filesystem::path;

} // namespace cstfs

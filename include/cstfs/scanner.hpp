#pragma once
#include "cstfs/config.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cstfs {

enum class Exclusion : std::uint8_t { IndexFile, NoExtension, NotMedia };

// Recursive walk over the files of a tree that are eligible for indexing.
//
// Every call to for_each() walks the tree again, so a scanner can be reused
// across passes. The walk is depth-first with each directory's entries
// sorted by name, so the order is stable between runs. Symlinked directories
// are not followed. Policy exclusions are reported to
// `log`; unreadable directories or metadata throw IoError and abort the walk.
class DirectoryScanner {
public:
  DirectoryScanner(Config cfg, std::ostream &log);

  // Calls `fn` with each eligible file's '/'-separated root-relative path
  void for_each(const std::function<void(const std::string &rel)> &fn) const;

  // Eagerly materialized for_each()
  [[nodiscard]] auto collect() const -> std::vector<std::string>;

  // Why `rel` would be skipped, or nullopt when it is eligible
  [[nodiscard]] auto classify(const std::filesystem::path &rel) const -> std::optional<Exclusion>;

  [[nodiscard]] const std::filesystem::path &root() const { return cfg_.root; }

private:
  void walk(const std::filesystem::path &dir,
            const std::function<void(const std::string &rel)> &fn) const;

  Config cfg_;
  std::ostream &log_;
};

} // namespace cstfs

#pragma once
#include "cstfs/config.hpp"
#include "cstfs/db.hpp"
#include "cstfs/diff.hpp"
#include "cstfs/index.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace cstfs {

struct BuildStats {
  std::size_t scanned = 0;    // eligible files seen
  std::size_t inserted = 0;   // new index rows
  std::size_t duplicates = 0; // collisions handed to the duplicate handler
};

class Store {
public:
  // Called for each collision during build_index(), inside the build transaction
  using DuplicateHandler =
      std::function<void(ContentIndex &index, sql::Transaction &tx, const DuplicateInsertion &dup,
                         const std::string &hash)>;

  explicit Store(Config cfg);

  [[nodiscard]] const Config &config() const { return cfg_; }
  [[nodiscard]] const std::filesystem::path &root() const { return cfg_.root; }
  [[nodiscard]] auto db_file() const -> std::filesystem::path { return db_path(cfg_); }

  // Convenience: does the index file exist?
  [[nodiscard]] auto is_initialized() const -> bool;

  // Walk, hash and insert every eligible file in one transaction, committed
  // once at the end. With `replace`, existing entries are deleted inside that
  // same transaction. Any exception before the commit leaves the previous
  // index intact.
  auto build_index(std::ostream &out, const DuplicateHandler &on_duplicate,
                   bool replace = false) const -> BuildStats;

  // Coalesced diff of the tree against the committed index. Read-only.
  // IndexError::Kind::Open if there is no index yet.
  [[nodiscard]] auto refresh(std::ostream &out) const -> std::vector<DiffRecord>;

  // Writing diffs back into the index. Always throws NotImplemented.
  [[noreturn]] void apply(const std::vector<DiffRecord> &diffs) const;

private:
  Config cfg_;
};

} // namespace cstfs

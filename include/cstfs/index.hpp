#pragma once
#include "cstfs/config.hpp"
#include "cstfs/db.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace cstfs {

struct IndexEntry {
  std::string path;  // "dir/file.jpg", root-relative, '/'-separated
  std::string hash;  // 16-hex digest, unique across entries
};

// `insert` refused because the digest is already indexed under another path.
struct DuplicateInsertion {
  std::string existing_path;
  std::string new_path;
};

// Persistent digest -> path table (root/cstfs.db by default).
//
// Mutating operations take the caller's transaction and never commit it
// themselves; the caller decides what a batch is.
class ContentIndex {
public:
  // Opens or creates the index for `cfg` and ensures the schema exists.
  // IndexError::Kind::Open or ::Migration on failure.
  explicit ContentIndex(const Config &cfg);
  explicit ContentIndex(const std::filesystem::path &db_file);

  // Rollback failures of the returned transaction are reported to `log`
  [[nodiscard]] auto begin(std::ostream &log) -> sql::Transaction;

  // Returns the collision instead of writing when `hash` is already present
  [[nodiscard]] auto insert(sql::Transaction &tx, std::string_view path, std::string_view hash)
      -> std::optional<DuplicateInsertion>;

  // Point the entry for `hash` at `new_path`.
  // HashDoesNotExist if absent, DuplicatePaths if the table holds several rows for it.
  void rebind_path(sql::Transaction &tx, std::string_view new_path, std::string_view hash);

  // Delete the entry for `hash`; TooFewRowsAffected if there was none
  void remove(sql::Transaction &tx, std::string_view hash);

  // Delete every entry; returns how many there were
  std::size_t clear(sql::Transaction &tx);

  // Full dump, ordered by path. MalformedDigest if a row holds a non-digest hash
  [[nodiscard]] auto scan_all() const -> std::vector<IndexEntry>;

  [[nodiscard]] auto find_by_path(std::string_view path) const -> std::optional<std::string>;
  [[nodiscard]] auto find_by_hash(std::string_view hash) const -> std::optional<std::string>;
  [[nodiscard]] auto count() const -> std::size_t;

private:
  void migrate();
  void check_tx(const sql::Transaction &tx) const;

  sql::Database db_;
};

} // namespace cstfs

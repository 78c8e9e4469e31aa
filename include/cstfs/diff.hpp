#pragma once
#include "cstfs/index.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace cstfs {

class DirectoryScanner; // fwd

// One scanned file: root-relative path and its content digest
struct DirectoryEntry {
  std::string path;
  std::string hash;
};

using LiveSnapshot = std::vector<DirectoryEntry>;
using IndexSnapshot = std::vector<IndexEntry>;

enum class DiffKind : std::uint8_t {
  New,       // digest not in the index
  Changed,   // same path, different digest
  Removed,   // indexed path no longer on disk
  Duplicate, // new path, digest indexed under a path that is still live
  Moved,     // new path, digest indexed under a path that is gone
};

struct DiffRecord {
  std::string path;
  std::string hash;
  DiffKind kind;
  std::string previous_hash; // Changed only
  std::string original_path; // Duplicate and Moved only
};

struct DiffSummary {
  std::size_t added = 0;
  std::size_t changed = 0;
  std::size_t removed = 0;
  std::size_t duplicates = 0;
  std::size_t moved = 0;

  [[nodiscard]] std::size_t total() const { return added + changed + removed + duplicates + moved; }
};

namespace diff {

const char *kind_name(DiffKind kind);

// Hash every file the scanner yields. IoError if a file cannot be read.
auto live_snapshot(const DirectoryScanner &scanner) -> LiveSnapshot;

// Elementary diffs: New/Changed for the live pass, in live order, then
// Removed for indexed paths missing from `live`, in index order.
auto generate(const LiveSnapshot &live, const IndexSnapshot &persisted) -> std::vector<DiffRecord>;

// Rewrite New records whose digest is indexed into Moved (paired with a
// Removed of the same digest, which is consumed) or Duplicate. One merge per
// pass until a pass merges nothing. Returns the number of merges.
std::size_t coalesce(std::vector<DiffRecord> &records, const IndexSnapshot &persisted);

auto summarize(const std::vector<DiffRecord> &records) -> DiffSummary;

// "moved: c.jpg (from a.jpg)"
auto describe(const DiffRecord &record) -> std::string;

} // namespace diff

} // namespace cstfs

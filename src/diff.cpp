#include "cstfs/diff.hpp"

#include "cstfs/hash.hpp"
#include "cstfs/scanner.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <unordered_map>

namespace cstfs::diff {

const char *kind_name(DiffKind kind) {
  switch (kind) {
  case DiffKind::New:
    return "new";
  case DiffKind::Changed:
    return "changed";
  case DiffKind::Removed:
    return "removed";
  case DiffKind::Duplicate:
    return "duplicate";
  case DiffKind::Moved:
    return "moved";
  }
  return "?";
}

LiveSnapshot live_snapshot(const DirectoryScanner &scanner) {
  LiveSnapshot live;
  scanner.for_each([&](const std::string &rel) {
    live.push_back(DirectoryEntry{.path = rel, .hash = hash_file(scanner.root() / rel)});
  });
  return live;
}

std::vector<DiffRecord> generate(const LiveSnapshot &live, const IndexSnapshot &persisted) {
  std::map<std::string, std::string> indexed; // path -> hash
  for (const auto &e : persisted)
    indexed.emplace(e.path, e.hash);

  std::vector<DiffRecord> out;
  std::set<std::string> live_paths;

  for (const auto &f : live) {
    live_paths.insert(f.path);
    const auto it = indexed.find(f.path);
    if (it == indexed.end()) {
      out.push_back({.path = f.path, .hash = f.hash, .kind = DiffKind::New});
    } else if (it->second != f.hash) {
      out.push_back(
          {.path = f.path, .hash = f.hash, .kind = DiffKind::Changed, .previous_hash = it->second});
    }
  }

  for (const auto &e : persisted) {
    if (!live_paths.contains(e.path))
      out.push_back({.path = e.path, .hash = e.hash, .kind = DiffKind::Removed});
  }
  return out;
}

// One rewrite step. Returns false when no New record has an indexed digest.
static bool merge_once(std::vector<DiffRecord> &records,
                       const std::unordered_map<std::string, std::string> &path_by_hash) {
  for (std::size_t i = 0; i < records.size(); ++i) {
    auto &rec = records[i];
    if (rec.kind != DiffKind::New)
      continue;
    const auto known = path_by_hash.find(rec.hash);
    if (known == path_by_hash.end())
      continue;

    const auto removed = std::ranges::find_if(records, [&](const DiffRecord &r) {
      return r.kind == DiffKind::Removed && r.hash == rec.hash;
    });
    if (removed == records.end()) {
      rec.kind = DiffKind::Duplicate;
      rec.original_path = known->second;
      return true;
    }

    rec.kind = DiffKind::Moved;
    rec.original_path = removed->path;
    records.erase(removed);
    return true;
  }
  return false;
}

std::size_t coalesce(std::vector<DiffRecord> &records, const IndexSnapshot &persisted) {
  std::unordered_map<std::string, std::string> path_by_hash;
  for (const auto &e : persisted)
    path_by_hash.emplace(e.hash, e.path);

  // Every merge turns one New into Moved or Duplicate, so at most
  // (number of New records) passes succeed.
  std::size_t merges = 0;
  while (merge_once(records, path_by_hash))
    ++merges;
  return merges;
}

DiffSummary summarize(const std::vector<DiffRecord> &records) {
  DiffSummary s;
  for (const auto &r : records) {
    switch (r.kind) {
    case DiffKind::New:
      ++s.added;
      break;
    case DiffKind::Changed:
      ++s.changed;
      break;
    case DiffKind::Removed:
      ++s.removed;
      break;
    case DiffKind::Duplicate:
      ++s.duplicates;
      break;
    case DiffKind::Moved:
      ++s.moved;
      break;
    }
  }
  return s;
}

std::string describe(const DiffRecord &r) {
  std::string s = std::string(kind_name(r.kind)) + ": " + r.path;
  switch (r.kind) {
  case DiffKind::Changed:
    s += " (" + r.previous_hash + " -> " + r.hash + ")";
    break;
  case DiffKind::Moved:
    s += " (from " + r.original_path + ")";
    break;
  case DiffKind::Duplicate:
    s += " (duplicate of " + r.original_path + ")";
    break;
  case DiffKind::New:
  case DiffKind::Removed:
    break;
  }
  return s;
}

} // namespace cstfs::diff

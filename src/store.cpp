#include "cstfs/store.hpp"

#include "cstfs/error.hpp"
#include "cstfs/fs.hpp"
#include "cstfs/hash.hpp"
#include "cstfs/scanner.hpp"
#include "cstfs/time.hpp"

#include <utility>

namespace stdfs = std::filesystem;

namespace cstfs {

Store::Store(Config cfg) : cfg_(std::move(cfg)) {}

auto Store::is_initialized() const -> bool { return fs::exists(db_file()); }

BuildStats Store::build_index(std::ostream &out, const DuplicateHandler &on_duplicate,
                              bool replace) const {
  ContentIndex index{cfg_};
  auto tx = index.begin(out);

  if (replace)
    out << "Regenerating index, dropping " << index.clear(tx) << " entries\n";
  out << "Starting index generation at \"" << root().string() << "\"\n";
  const auto start = timeutil::clock::now();

  const DirectoryScanner scanner{cfg_, out};
  const auto paths = scanner.collect();
  const auto total = paths.size();

  BuildStats stats;
  for (const auto &rel : paths) {
    ++stats.scanned;
    out << "Adding file " << stats.scanned << "/" << total << "...\n" << std::flush;

    std::string h;
    try {
      h = hash_file(root() / rel);
    } catch (const IoError &e) {
      throw IoError("could not hash file " + rel + ": " + e.what());
    }

    if (const auto dup = index.insert(tx, rel, h)) {
      ++stats.duplicates;
      on_duplicate(index, tx, *dup, h);
    } else {
      ++stats.inserted;
    }
  }

  tx.commit();
  out << "Done generating index at \"" << root().string() << "\". Took "
      << timeutil::elapsed_since(start) << "\n";
  return stats;
}

std::vector<DiffRecord> Store::refresh(std::ostream &out) const {
  if (!is_initialized())
    throw IndexError(IndexError::Kind::Open, "no index at " + db_file().string());

  const ContentIndex index{cfg_};
  out << "Starting refresh of \"" << root().string() << "\"\n";
  const auto start = timeutil::clock::now();

  const auto persisted = index.scan_all();
  const DirectoryScanner scanner{cfg_, out};
  const auto live = diff::live_snapshot(scanner);

  auto records = diff::generate(live, persisted);
  diff::coalesce(records, persisted);

  out << "Done refreshing \"" << root().string() << "\". Took " << timeutil::elapsed_since(start)
      << "\n";
  return records;
}

void Store::apply(const std::vector<DiffRecord> &diffs) const {
  throw NotImplemented("applying " + std::to_string(diffs.size()) +
                       " diff(s) to the index is not implemented");
}

} // namespace cstfs

#include "cstfs/error.hpp"
#include "cstfs/index.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using cstfs::ContentIndex;
using cstfs::IndexError;

static bool throws_kind(IndexError::Kind kind, const auto &fn) {
  try {
    fn();
  } catch (const IndexError &e) {
    return e.kind() == kind;
  }
  return false;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("cstfs_index_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);
  const fs::path db = root / "cstfs.db";

  try {
    const std::string h1 = "00000000000000a1";
    const std::string h2 = "00000000000000b2";

    // Open twice: schema creation is idempotent
    { ContentIndex first{db}; }
    ContentIndex idx{db};
    if (idx.count() != 0) {
      std::cerr << "fresh index not empty\n";
      return 1;
    }

    // 1) Inserts and the uniqueness invariant
    {
      auto tx = idx.begin(std::cerr);
      if (idx.insert(tx, "a.jpg", h1) || idx.insert(tx, "b.jpg", h2)) {
        std::cerr << "unexpected duplicate on fresh insert\n";
        return 1;
      }
      const auto dup = idx.insert(tx, "c.jpg", h1);
      if (!dup || dup->existing_path != "a.jpg" || dup->new_path != "c.jpg") {
        std::cerr << "expected DuplicateInsertion{a.jpg, c.jpg}\n";
        return 1;
      }
      tx.commit();
    }
    if (idx.count() != 2 || idx.find_by_hash(h1) != "a.jpg") {
      std::cerr << "duplicate insert created a second row\n";
      return 1;
    }

    // 2) Lookups distinguish "no row"
    if (idx.find_by_path("b.jpg") != h2 || idx.find_by_path("zzz.jpg").has_value() ||
        idx.find_by_hash("ffffffffffffffff").has_value()) {
      std::cerr << "lookup mismatch\n";
      return 1;
    }

    // 3) Rebind keeps exactly one entry for the hash
    {
      auto tx = idx.begin(std::cerr);
      idx.rebind_path(tx, "moved/a.jpg", h1);
      tx.commit();
    }
    {
      const auto all = idx.scan_all();
      int n = 0;
      for (const auto &e : all) {
        if (e.hash == h1) {
          ++n;
          if (e.path != "moved/a.jpg") {
            std::cerr << "rebind did not update path\n";
            return 1;
          }
        }
      }
      if (n != 1 || all.size() != 2) {
        std::cerr << "rebind changed the row count\n";
        return 1;
      }
    }

    // 4) Rebinding an unknown hash
    {
      auto tx = idx.begin(std::cerr);
      if (!throws_kind(IndexError::Kind::HashDoesNotExist,
                       [&] { idx.rebind_path(tx, "x.jpg", "0123456789abcdef"); })) {
        std::cerr << "expected HashDoesNotExist\n";
        return 1;
      }
    }

    // 5) No commit => rollback
    {
      auto tx = idx.begin(std::cerr);
      (void)idx.insert(tx, "d.jpg", "00000000000000d4");
      idx.remove(tx, h2);
    }
    if (idx.count() != 2 || idx.find_by_path("d.jpg") || !idx.find_by_hash(h2)) {
      std::cerr << "uncommitted transaction leaked into the index\n";
      return 1;
    }

    // 6) remove
    {
      auto tx = idx.begin(std::cerr);
      idx.remove(tx, h2);
      if (!throws_kind(IndexError::Kind::TooFewRowsAffected, [&] { idx.remove(tx, h2); })) {
        std::cerr << "expected TooFewRowsAffected removing twice\n";
        return 1;
      }
      tx.commit();
    }
    if (idx.count() != 1) {
      std::cerr << "remove did not delete\n";
      return 1;
    }

    // 7) Writes need a live transaction
    {
      auto tx = idx.begin(std::cerr);
      tx.commit();
      if (!throws_kind(IndexError::Kind::Query, [&] { (void)idx.insert(tx, "e.jpg", h2); })) {
        std::cerr << "insert on a committed transaction was accepted\n";
        return 1;
      }
    }

    // 8) Persistence across handles
    {
      const ContentIndex reopened{db};
      if (reopened.find_by_hash(h1) != "moved/a.jpg") {
        std::cerr << "committed data not visible after reopen\n";
        return 1;
      }
    }

    // 9) Opening inside a missing directory fails as Open
    if (!throws_kind(IndexError::Kind::Open,
                     [&] { ContentIndex bad{root / "no" / "such" / "dir" / "x.db"}; })) {
      std::cerr << "expected Open error\n";
      return 1;
    }

    // 10) A file that is not an SQLite database fails as Migration
    {
      const fs::path junk = root / "junk.db";
      std::ofstream(junk, std::ios::binary) << std::string(4096, 'x');
      if (!throws_kind(IndexError::Kind::Migration, [&] { ContentIndex bad{junk}; })) {
        std::cerr << "expected Migration error for a non-database file\n";
        return 1;
      }
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

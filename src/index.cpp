#include "cstfs/index.hpp"

#include "cstfs/error.hpp"
#include "cstfs/util.hpp"

#include <string>
#include <utility>

namespace cstfs {

using Kind = IndexError::Kind;

namespace {

constexpr std::string_view kSchema = R"(
  CREATE TABLE IF NOT EXISTS files (
    path TEXT NOT NULL,
    hash TEXT NOT NULL PRIMARY KEY
  ))";

// Writes are expected to touch exactly one row; anything else is a bug or a
// concurrent writer, never user error.
void expect_one_row(int changed, std::string_view op, std::string_view hash) {
  if (changed < 1)
    throw IndexError(Kind::TooFewRowsAffected,
                     std::string(op) + " of " + std::string(hash) + " changed no rows");
  if (changed > 1)
    throw IndexError(Kind::TooManyRowsAffected, std::string(op) + " of " + std::string(hash) +
                                                    " changed " + std::to_string(changed) +
                                                    " rows");
}

} // namespace

ContentIndex::ContentIndex(const Config &cfg) : ContentIndex(db_path(cfg)) {}

ContentIndex::ContentIndex(const std::filesystem::path &db_file) : db_(db_file) { migrate(); }

void ContentIndex::migrate() {
  try {
    db_.exec(kSchema);
  } catch (const IndexError &e) {
    throw IndexError(Kind::Migration, std::string("failed creating table: ") + e.what());
  }
}

void ContentIndex::check_tx(const sql::Transaction &tx) const {
  if (!tx.active() || &tx.database() != &db_)
    throw IndexError(Kind::Query, "write outside an active transaction on this index");
}

sql::Transaction ContentIndex::begin(std::ostream &log) { return sql::Transaction{db_, log}; }

std::optional<DuplicateInsertion> ContentIndex::insert(sql::Transaction &tx, std::string_view path,
                                                       std::string_view hash) {
  check_tx(tx);
  if (auto existing = find_by_hash(hash)) {
    return DuplicateInsertion{.existing_path = std::move(*existing),
                              .new_path = std::string(path)};
  }
  sql::Statement st(db_, "INSERT INTO files (path, hash) VALUES (?1, ?2)");
  st.bind(1, path).bind(2, hash);
  expect_one_row(st.execute(), "insert", hash);
  return std::nullopt;
}

void ContentIndex::rebind_path(sql::Transaction &tx, std::string_view new_path,
                               std::string_view hash) {
  check_tx(tx);
  std::vector<std::string> paths;
  {
    sql::Statement sel(db_, "SELECT path FROM files WHERE hash = ?1");
    sel.bind(1, hash);
    while (sel.step())
      paths.push_back(sel.column_text(0));
  }
  if (paths.empty())
    throw IndexError(Kind::HashDoesNotExist, "hash " + std::string(hash) + " is not indexed");
  if (paths.size() > 1) {
    std::string all;
    for (const auto &p : paths)
      all += (all.empty() ? "" : ", ") + p;
    throw IndexError(Kind::DuplicatePaths,
                     "hash " + std::string(hash) + " is indexed under several paths: " + all);
  }

  sql::Statement upd(db_, "UPDATE files SET path = ?1 WHERE hash = ?2");
  upd.bind(1, new_path).bind(2, hash);
  expect_one_row(upd.execute(), "rebind", hash);
}

void ContentIndex::remove(sql::Transaction &tx, std::string_view hash) {
  check_tx(tx);
  sql::Statement del(db_, "DELETE FROM files WHERE hash = ?1");
  del.bind(1, hash);
  expect_one_row(del.execute(), "remove", hash);
}

std::size_t ContentIndex::clear(sql::Transaction &tx) {
  check_tx(tx);
  sql::Statement del(db_, "DELETE FROM files");
  return static_cast<std::size_t>(del.execute());
}

std::vector<IndexEntry> ContentIndex::scan_all() const {
  std::vector<IndexEntry> out;
  sql::Statement st(db_, "SELECT path, hash FROM files ORDER BY path");
  while (st.step()) {
    IndexEntry e{.path = st.column_text(0), .hash = st.column_text(1)};
    if (!looks_hex16(e.hash))
      throw IndexError(Kind::MalformedDigest,
                       "entry " + e.path + " has malformed digest \"" + e.hash + "\"");
    out.push_back(std::move(e));
  }
  return out;
}

std::optional<std::string> ContentIndex::find_by_path(std::string_view path) const {
  sql::Statement st(db_, "SELECT hash FROM files WHERE path = ?1");
  st.bind(1, path);
  if (!st.step())
    return std::nullopt;
  return st.column_text(0);
}

std::optional<std::string> ContentIndex::find_by_hash(std::string_view hash) const {
  sql::Statement st(db_, "SELECT path FROM files WHERE hash = ?1");
  st.bind(1, hash);
  if (!st.step())
    return std::nullopt;
  return st.column_text(0);
}

std::size_t ContentIndex::count() const {
  sql::Statement st(db_, "SELECT COUNT(*) FROM files");
  if (!st.step())
    throw IndexError(Kind::Query, "count returned no row");
  return static_cast<std::size_t>(st.column_int(0));
}

} // namespace cstfs

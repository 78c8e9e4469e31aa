#pragma once
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace cstfs::sql {

// Owning handle on one SQLite database file. Failures throw IndexError.
class Database {
public:
  // Opens or creates the file; IndexError::Kind::Open on failure
  explicit Database(const std::filesystem::path &file);
  ~Database();

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;
  Database(Database &&other) noexcept;
  Database &operator=(Database &&other) noexcept;

  // Run one or more statements without results; throws IndexError::Kind::Query
  void exec(std::string_view sql);

  [[nodiscard]] sqlite3 *handle() const { return db_; }
  [[nodiscard]] const std::filesystem::path &file() const { return file_; }
  [[nodiscard]] std::string last_error() const;

private:
  sqlite3 *db_ = nullptr;
  std::filesystem::path file_;
};

// Prepared statement with positional (1-based) text parameters.
class Statement {
public:
  Statement(const Database &db, std::string_view sql);
  ~Statement();

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  Statement &bind(int index, std::string_view value);

  // Advance to the next row; false when done
  bool step();

  // Run to completion and return the number of rows changed
  int execute();

  [[nodiscard]] std::string column_text(int col) const;
  [[nodiscard]] long long column_int(int col) const;

private:
  const Database &db_;
  sqlite3_stmt *stmt_ = nullptr;
  std::string sql_;
};

// Write transaction. Rolled back on destruction unless commit() succeeded, so
// an exception before commit leaves the database as it was. A failed rollback
// is reported to `log`.
class Transaction {
public:
  Transaction(Database &db, std::ostream &log);
  ~Transaction();

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  // IndexError::Kind::Commit on failure
  void commit();

  [[nodiscard]] bool active() const { return active_; }
  [[nodiscard]] const Database &database() const { return db_; }

private:
  Database &db_;
  std::ostream &log_;
  bool active_ = false;
};

} // namespace cstfs::sql

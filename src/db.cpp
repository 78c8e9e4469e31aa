#include "cstfs/db.hpp"

#include "cstfs/error.hpp"

#include <sqlite3.h>

#include <utility>

namespace cstfs::sql {

using Kind = IndexError::Kind;

Database::Database(const std::filesystem::path &file) : file_(file) {
  const int rc = sqlite3_open_v2(file.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                                 nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw IndexError(Kind::Open, "failed to open index at " + file.string() + ": " + msg);
  }
  sqlite3_extended_result_codes(db_, 1);
}

Database::~Database() {
  if (db_)
    sqlite3_close(db_);
}

Database::Database(Database &&other) noexcept
    : db_(std::exchange(other.db_, nullptr)), file_(std::move(other.file_)) {}

Database &Database::operator=(Database &&other) noexcept {
  if (this != &other) {
    if (db_)
      sqlite3_close(db_);
    db_ = std::exchange(other.db_, nullptr);
    file_ = std::move(other.file_);
  }
  return *this;
}

void Database::exec(std::string_view sql) {
  const std::string text(sql);
  char *err = nullptr;
  if (sqlite3_exec(db_, text.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : last_error();
    sqlite3_free(err);
    throw IndexError(Kind::Query, "exec failed: " + msg);
  }
}

std::string Database::last_error() const { return db_ ? sqlite3_errmsg(db_) : "no database"; }

Statement::Statement(const Database &db, std::string_view sql) : db_(db), sql_(sql) {
  if (sqlite3_prepare_v2(db.handle(), sql_.data(), static_cast<int>(sql_.size()), &stmt_,
                         nullptr) != SQLITE_OK) {
    throw IndexError(Kind::Query, "prepare failed: " + db.last_error() + " [" + sql_ + "]");
  }
}

Statement::~Statement() { sqlite3_finalize(stmt_); }

Statement &Statement::bind(int index, std::string_view value) {
  if (sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK) {
    throw IndexError(Kind::Query, "bind failed: " + db_.last_error() + " [" + sql_ + "]");
  }
  return *this;
}

bool Statement::step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW)
    return true;
  if (rc == SQLITE_DONE)
    return false;
  throw IndexError(Kind::Query, "step failed: " + db_.last_error() + " [" + sql_ + "]");
}

int Statement::execute() {
  while (step()) {
  }
  return sqlite3_changes(db_.handle());
}

std::string Statement::column_text(int col) const {
  const auto *txt = sqlite3_column_text(stmt_, col);
  if (!txt)
    return {};
  return std::string(reinterpret_cast<const char *>(txt),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
}

long long Statement::column_int(int col) const { return sqlite3_column_int64(stmt_, col); }

Transaction::Transaction(Database &db, std::ostream &log) : db_(db), log_(log) {
  db_.exec("BEGIN IMMEDIATE");
  active_ = true;
}

Transaction::~Transaction() {
  if (!active_)
    return;
  if (sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK)
    log_ << "index: rollback failed: " << db_.last_error() << "\n";
}

void Transaction::commit() {
  if (!active_)
    throw IndexError(Kind::Commit, "commit on a transaction that is not active");
  if (sqlite3_exec(db_.handle(), "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK)
    throw IndexError(Kind::Commit, "commit failed: " + db_.last_error());
  active_ = false;
}

} // namespace cstfs::sql

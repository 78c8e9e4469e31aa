#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace cstfs {

// Filesystem failure while scanning, hashing or deleting.
class IoError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Failure of the persisted content index. Everything except a lookup that
// finds no row ends up here; all kinds are fatal for the current run.
class IndexError : public std::runtime_error {
public:
  enum class Kind : std::uint8_t {
    Open,
    Migration,
    Query,
    Commit,
    TooFewRowsAffected,
    TooManyRowsAffected,
    HashDoesNotExist,
    DuplicatePaths,
    MalformedDigest,
  };

  IndexError(Kind kind, const std::string &what) : std::runtime_error(what), kind_(kind) {}

  [[nodiscard]] Kind kind() const { return kind_; }

private:
  Kind kind_;
};

const char *to_string(IndexError::Kind kind);

// The operator asked to stop at a duplicate prompt.
class Aborted : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Requested behaviour exists in the command grammar but has no implementation.
class NotImplemented : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace cstfs

#include "cstfs/error.hpp"

namespace cstfs {

const char *to_string(IndexError::Kind kind) {
  switch (kind) {
  case IndexError::Kind::Open:
    return "open";
  case IndexError::Kind::Migration:
    return "migration";
  case IndexError::Kind::Query:
    return "query";
  case IndexError::Kind::Commit:
    return "commit";
  case IndexError::Kind::TooFewRowsAffected:
    return "too few rows affected";
  case IndexError::Kind::TooManyRowsAffected:
    return "too many rows affected";
  case IndexError::Kind::HashDoesNotExist:
    return "hash does not exist";
  case IndexError::Kind::DuplicatePaths:
    return "duplicate paths";
  case IndexError::Kind::MalformedDigest:
    return "malformed digest";
  }
  return "unknown";
}

} // namespace cstfs

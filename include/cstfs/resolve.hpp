#pragma once
#include "cstfs/db.hpp"
#include "cstfs/index.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace cstfs::resolve {

enum class Command : std::uint8_t { RemoveNew, Quit, Skip, RemoveOld, Help, Invalid };

enum class Action : std::uint8_t {
  RemoveNew,   // delete the new file, index unchanged
  RemoveOld,   // delete the indexed file, rebind the digest to the new path
  Abort,       // stop the whole run
  Unsupported, // ignore list, not implemented
  Reprompt,    // print `message` and ask again
};

struct Decision {
  Action action;
  std::string message;
};

// Trimmed, case-insensitive: "" and "y", "n", "s", "o", "?"
auto parse_command(std::string_view line) -> Command;

// Pure step of the prompt loop
auto decide(Command cmd) -> Decision;

auto help_text() -> std::string;

// Interactive resolution of one collision reported by ContentIndex::insert.
// Reads one line per prompt from `in`; EOF is an IoError. `n` throws Aborted,
// `s` throws NotImplemented. Returns the action that ended the loop.
Action resolve_duplicate(ContentIndex &index, sql::Transaction &tx,
                         const std::filesystem::path &root, const DuplicateInsertion &dup,
                         std::string_view hash, std::istream &in, std::ostream &out);

} // namespace cstfs::resolve

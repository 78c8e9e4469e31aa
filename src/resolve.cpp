#include "cstfs/resolve.hpp"

#include "cstfs/consts.hpp"
#include "cstfs/error.hpp"
#include "cstfs/fs.hpp"
#include "cstfs/util.hpp"

#include <string>

namespace cstfs::resolve {

Command parse_command(std::string_view line) {
  const auto s = strutil::to_lower(strutil::trim(line));
  if (s.empty() || s == "y")
    return Command::RemoveNew;
  if (s == "n")
    return Command::Quit;
  if (s == "s")
    return Command::Skip;
  if (s == "o")
    return Command::RemoveOld;
  if (s == "?")
    return Command::Help;
  return Command::Invalid;
}

std::string help_text() {
  return "y(Yes)  - Remove the new file\n"
         "n(No)   - Do not remove the file and quit the program\n"
         "s(Skip) - Skip the file and add it to the ignore list\n"
         "o(Old)  - Remove the old file and keep the new one\n"
         "?(Help) - Print this message\n";
}

Decision decide(Command cmd) {
  switch (cmd) {
  case Command::RemoveNew:
    return {.action = Action::RemoveNew, .message = {}};
  case Command::Quit:
    return {.action = Action::Abort, .message = "Quitting..."};
  case Command::Skip:
    return {.action = Action::Unsupported,
            .message = "Adding a file to the ignore list is not implemented"};
  case Command::RemoveOld:
    return {.action = Action::RemoveOld, .message = {}};
  case Command::Help:
    return {.action = Action::Reprompt, .message = help_text()};
  case Command::Invalid:
    break;
  }
  return {.action = Action::Reprompt,
          .message = "Invalid command, valid ones are (" + std::string(consts::kValidCommands) +
                     ")\n"};
}

Action resolve_duplicate(ContentIndex &index, sql::Transaction &tx,
                         const std::filesystem::path &root, const DuplicateInsertion &dup,
                         std::string_view hash, std::istream &in, std::ostream &out) {
  out << "Found path \"" << dup.new_path << "\", duplicate of \"" << dup.existing_path
      << "\", would you like to remove it? (" << consts::kValidCommands << "): " << std::flush;

  for (;;) {
    std::string line;
    if (!std::getline(in, line))
      throw IoError("failed reading answer for duplicate " + dup.new_path);

    const auto d = decide(parse_command(line));
    switch (d.action) {
    case Action::RemoveNew:
      fs::remove_file(root / dup.new_path);
      out << "Removed file " << dup.new_path << "\n" << std::flush;
      return d.action;
    case Action::RemoveOld:
      fs::remove_file(root / dup.existing_path);
      out << "Removed file " << dup.existing_path << "\n";
      index.rebind_path(tx, dup.new_path, hash);
      out << "Updated index with " << dup.new_path << "\n" << std::flush;
      return d.action;
    case Action::Abort:
      out << d.message << "\n" << std::flush;
      throw Aborted("aborted by operator at duplicate " + dup.new_path);
    case Action::Unsupported:
      throw NotImplemented(d.message);
    case Action::Reprompt:
      out << d.message << std::flush;
      break;
    }
  }
}

} // namespace cstfs::resolve

#include "cli/command.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace cstfs::cli {

namespace {

constexpr std::array kCommands{
    Command{.name = "init",
            .run = cmd_init,
            .summary = "Build the index for the data directory: cstfs init [-f|--force]"},
    Command{.name = "refresh",
            .run = cmd_refresh,
            .summary = "Show what changed since the index was built"},
    Command{.name = "apply",
            .run = cmd_apply,
            .summary = "Write refresh results into the index (unsupported)"},
};

} // namespace

auto commands() -> std::span<const Command> { return kCommands; }

auto find_command(std::string_view name) -> const Command * {
  const auto it = std::ranges::find(kCommands, name, &Command::name);
  return it == kCommands.end() ? nullptr : &*it;
}

void print_usage(std::ostream &out) {
  out << "usage: cstfs [-d <data dir>] <command> [args]\n\n";
  out << "commands:\n";
  const auto width = std::ranges::max(kCommands, {}, [](const Command &c) {
                       return c.name.size();
                     }).name.size();
  for (const auto &c : kCommands)
    out << "  " << c.name << std::string(width - c.name.size() + 2, ' ') << c.summary << "\n";
}

} // namespace cstfs::cli

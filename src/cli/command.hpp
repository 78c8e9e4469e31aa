#pragma once
#include <filesystem>
#include <ostream>
#include <span>
#include <string_view>

namespace cstfs::cli {

// Subcommand entry point: data directory from -d, then argv starting at the command name
using command_fn = int (*)(const std::filesystem::path &data_dir, int argc, char **argv);

struct Command {
  std::string_view name;
  command_fn run;
  std::string_view summary;
};

// Fixed table, in the order usage lists it
auto commands() -> std::span<const Command>;
auto find_command(std::string_view name) -> const Command *;
void print_usage(std::ostream &out);

int cmd_init(const std::filesystem::path &data_dir, int argc, char **argv);
int cmd_refresh(const std::filesystem::path &data_dir, int argc, char **argv);
int cmd_apply(const std::filesystem::path &data_dir, int argc, char **argv);

} // namespace cstfs::cli

#include "cli/command.hpp"

#include <filesystem>
#include <iostream>
#include <string_view>

int main(int argc, char **argv) {
  // Global option before the subcommand: -d <data dir>
  std::filesystem::path data_dir = ".";
  int first = 1;
  if (argc > 2 && std::string_view(argv[1]) == "-d") {
    data_dir = argv[2];
    first = 3;
  }

  if (argc <= first) {
    cstfs::cli::print_usage(std::cerr);
    return 2;
  }
  const std::string_view name = argv[first];

  const auto *cmd = cstfs::cli::find_command(name);
  if (!cmd) {
    std::cerr << "unknown command: " << name << "\n";
    cstfs::cli::print_usage(std::cerr);
    return 2;
  }
  // Pass everything from the subcommand on to the handler
  return cmd->run(data_dir, argc - first, argv + first);
}

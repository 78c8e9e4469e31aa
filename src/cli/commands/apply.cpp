#include "cli/command.hpp"

#include "cstfs/config.hpp"
#include "cstfs/store.hpp"

#include <filesystem>
#include <iostream>

namespace cstfs::cli {

int cmd_apply(const std::filesystem::path &data_dir, int /*argc*/, char ** /*argv*/) {
  try {
    const cstfs::Store store{cstfs::load_config(data_dir)};
    std::ostream quiet{nullptr};
    store.apply(store.refresh(quiet));
  } catch (const std::exception &e) {
    std::cerr << "apply: " << e.what() << "\n";
  }
  return 1;
}

} // namespace cstfs::cli

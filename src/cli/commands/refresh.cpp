#include "cli/command.hpp"

#include "cstfs/config.hpp"
#include "cstfs/error.hpp"
#include "cstfs/diff.hpp"
#include "cstfs/store.hpp"

#include <filesystem>
#include <iostream>

namespace cstfs::cli {

int cmd_refresh(const std::filesystem::path &data_dir, int /*argc*/, char ** /*argv*/) {
  try {
    const cstfs::Store store{cstfs::load_config(data_dir)};
    if (!store.is_initialized()) {
      std::cerr << "refresh: no index in " << data_dir << " (run `cstfs init`)\n";
      return 1;
    }

    const auto records = store.refresh(std::cout);
    for (const auto &r : records)
      std::cout << "  " << cstfs::diff::describe(r) << "\n";
    if (records.empty())
      std::cout << "  (no changes)\n";

    const auto s = cstfs::diff::summarize(records);
    std::cout << s.added << " new, " << s.changed << " changed, " << s.removed << " removed, "
              << s.moved << " moved, " << s.duplicates << " duplicate\n";
    return 0;
  } catch (const cstfs::IndexError &e) {
    std::cerr << "refresh: index " << cstfs::to_string(e.kind()) << " error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "refresh: " << e.what() << "\n";
    return 1;
  }
}

} // namespace cstfs::cli

#include "cli/command.hpp"

#include "cstfs/config.hpp"
#include "cstfs/error.hpp"
#include "cstfs/resolve.hpp"
#include "cstfs/store.hpp"

#include <filesystem>
#include <iostream>
#include <string_view>

namespace cstfs::cli {

int cmd_init(const std::filesystem::path &data_dir, int argc, char **argv) {
  bool force = false;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "-f" || arg == "--force") {
      force = true;
    } else {
      std::cerr << "usage: cstfs init [-f|--force]\n";
      return 2;
    }
  }

  try {
    const cstfs::Store store{cstfs::load_config(data_dir)};
    if (store.is_initialized() && !force) {
      std::cerr << "init: cannot initialize an index that already exists: " << store.db_file()
                << "\n";
      return 1;
    }

    const auto stats = store.build_index(
        std::cout, [&store](cstfs::ContentIndex &index, cstfs::sql::Transaction &tx,
                            const cstfs::DuplicateInsertion &dup, const std::string &hash) {
          cstfs::resolve::resolve_duplicate(index, tx, store.root(), dup, hash, std::cin,
                                            std::cout);
        },
        force);
    std::cout << "Indexed " << stats.inserted << " file(s), " << stats.duplicates
              << " duplicate(s) resolved\n";
    return 0;
  } catch (const cstfs::IndexError &e) {
    std::cerr << "init: index " << cstfs::to_string(e.kind()) << " error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}

} // namespace cstfs::cli

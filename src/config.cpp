#include "cstfs/config.hpp"

#include "cstfs/consts.hpp"
#include "cstfs/fs.hpp"
#include "cstfs/util.hpp"

#include <sstream>
#include <string_view>

namespace {

// "jpg, .PNG,mp4" -> {"jpg", "png", "mp4"}
std::set<std::string> parse_extensions(std::string_view list) {
  std::set<std::string> out;
  std::size_t pos = 0;
  while (pos <= list.size()) {
    const std::size_t comma = list.find(',', pos);
    const auto end = comma == std::string_view::npos ? list.size() : comma;
    std::string ext = cstfs::strutil::to_lower(cstfs::strutil::trim(list.substr(pos, end - pos)));
    if (!ext.empty() && ext.front() == '.')
      ext.erase(0, 1);
    if (!ext.empty())
      out.insert(std::move(ext));
    if (comma == std::string_view::npos)
      break;
    pos = comma + 1;
  }
  return out;
}

} // namespace

namespace cstfs {

static std::filesystem::path cfg_path(const std::filesystem::path &root) {
  return root / consts::kConfigFile;
}

auto default_config(const std::filesystem::path &root) -> Config {
  Config cfg{.root = root, .db_name = std::string(consts::kDefaultDbName), .extensions = {}};
  for (const auto ext : consts::kMediaExtensions)
    cfg.extensions.emplace(ext);
  return cfg;
}

auto load_config(const std::filesystem::path &root) -> Config {
  Config out = default_config(root);
  const auto path = cfg_path(root);
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(consts::kKeyDb)) {
      if (auto name = strutil::trim(sv.substr(consts::kKeyDb.size())); !name.empty())
        out.db_name = std::move(name);
    } else if (sv.starts_with(consts::kKeyExtensions)) {
      out.extensions = parse_extensions(sv.substr(consts::kKeyExtensions.size()));
    }
  }
  return out;
}

auto db_path(const Config &cfg) -> std::filesystem::path { return cfg.root / cfg.db_name; }

} // namespace cstfs

#include "cstfs/scanner.hpp"

#include "cstfs/error.hpp"
#include "cstfs/fs.hpp"
#include "cstfs/util.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace stdfs = std::filesystem;

namespace cstfs {

DirectoryScanner::DirectoryScanner(Config cfg, std::ostream &log) : cfg_(std::move(cfg)), log_(log) {}

std::optional<Exclusion> DirectoryScanner::classify(const stdfs::path &rel) const {
  if (rel == stdfs::path(cfg_.db_name))
    return Exclusion::IndexFile;
  // ".jpg" is a stem without extension, like "README"
  const auto ext = rel.extension().string();
  if (ext.size() <= 1)
    return Exclusion::NoExtension;
  if (!cfg_.extensions.contains(strutil::to_lower(ext.substr(1))))
    return Exclusion::NotMedia;
  return std::nullopt;
}

void DirectoryScanner::walk(const stdfs::path &dir,
                            const std::function<void(const std::string &rel)> &fn) const {
  std::error_code ec;
  std::vector<stdfs::directory_entry> entries;
  for (auto it = stdfs::directory_iterator(dir, ec); !ec && it != stdfs::directory_iterator();
       it.increment(ec)) {
    entries.push_back(*it);
  }
  if (ec)
    throw IoError("read directory failed: " + dir.string() + ": " + ec.message());

  std::ranges::sort(entries, [](const auto &a, const auto &b) { return a.path() < b.path(); });

  for (const auto &entry : entries) {
    const auto status = entry.symlink_status(ec);
    if (ec)
      throw IoError("stat failed: " + entry.path().string() + ": " + ec.message());

    if (stdfs::is_directory(status)) {
      walk(entry.path(), fn);
      continue;
    }
    if (!entry.is_regular_file(ec)) {
      if (ec)
        throw IoError("stat failed: " + entry.path().string() + ": " + ec.message());
      continue;
    }

    const auto rel = fs::relative_generic(entry.path(), cfg_.root);
    if (const auto why = classify(rel)) {
      switch (*why) {
      case Exclusion::IndexFile:
        break;
      case Exclusion::NoExtension:
        log_ << "excluded (no extension): " << rel << "\n";
        break;
      case Exclusion::NotMedia:
        log_ << "excluded (not a media file): " << rel << "\n";
        break;
      }
      continue;
    }
    fn(rel);
  }
}

void DirectoryScanner::for_each(const std::function<void(const std::string &rel)> &fn) const {
  walk(cfg_.root, fn);
}

std::vector<std::string> DirectoryScanner::collect() const {
  std::vector<std::string> out;
  for_each([&out](const std::string &rel) { out.push_back(rel); });
  return out;
}

} // namespace cstfs

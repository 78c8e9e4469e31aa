#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace cstfs::fs {

bool exists(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);

// Delete a file; a file that is already gone counts as success.
void remove_file(const std::filesystem::path& p);

// `p` relative to `root`, '/'-separated. Throws IoError if `p` is not under `root`.
std::string relative_generic(const std::filesystem::path& p, const std::filesystem::path& root);

// Read-only mapping of a whole file. Empty files are not mapped and expose an empty span.
class MappedFile {
public:
  explicit MappedFile(const std::filesystem::path& p);
  ~MappedFile();

  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;

  [[nodiscard]] std::span<const std::uint8_t> bytes() const {
    return {static_cast<const std::uint8_t*>(data_), size_};
  }

private:
  void* data_ = nullptr;
  std::size_t size_ = 0;
};

} // namespace cstfs::fs

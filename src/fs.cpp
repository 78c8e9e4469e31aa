#include "cstfs/fs.hpp"

#include "cstfs/error.hpp"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>
#include <system_error>

namespace cstfs::fs {

namespace {

std::string errno_message() { return std::error_code(errno, std::generic_category()).message(); }

} // namespace

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw IoError("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  return buf;
}

void remove_file(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::remove(p, ec);
  if (ec && ec != std::errc::no_such_file_or_directory)
    throw IoError("remove failed: " + p.string() + ": " + ec.message());
}

std::string relative_generic(const std::filesystem::path &p, const std::filesystem::path &root) {
  const auto rel = p.lexically_relative(root);
  if (rel.empty() || *rel.begin() == "..")
    throw IoError("path \"" + p.string() + "\" is not under \"" + root.string() + "\"");
  return rel.generic_string();
}

MappedFile::MappedFile(const std::filesystem::path &p) {
  const int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0)
    throw IoError("open failed: " + p.string() + ": " + errno_message());

  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    const auto msg = errno_message();
    ::close(fd);
    throw IoError("stat failed: " + p.string() + ": " + msg);
  }

  size_ = static_cast<std::size_t>(st.st_size);
  if (size_ != 0) {
    void *m = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd, 0);
    if (m == MAP_FAILED) {
      const auto msg = errno_message();
      ::close(fd);
      throw IoError("mmap failed: " + p.string() + ": " + msg);
    }
    data_ = m;
  }
  // the mapping stays valid after the descriptor is closed
  ::close(fd);
}

MappedFile::~MappedFile() {
  if (data_ != nullptr)
    ::munmap(data_, size_);
}

} // namespace cstfs::fs

#include "verdict/common/file_descriptor.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/core.h>

#include "verdict/common/diagnostic.hpp"

namespace verdict::common {

void FileDescriptor::Close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

auto OpenForReading(const std::filesystem::path& path)
    -> Result<FileDescriptor> {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "cannot open '{}' for reading: {}", path.string(),
                std::strerror(errno))));
  }
  return FileDescriptor(fd);
}

auto CreateForWriting(const std::filesystem::path& path)
    -> Result<FileDescriptor> {
  int fd = ::open(
      path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
      S_IRUSR | S_IWUSR);
  if (fd == -1) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "cannot create '{}': {}", path.string(),
                std::strerror(errno))));
  }
  return FileDescriptor(fd);
}

}  // namespace verdict::common

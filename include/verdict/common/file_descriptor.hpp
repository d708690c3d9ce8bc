#pragma once

#include <filesystem>
#include <utility>

#include "verdict/common/diagnostic.hpp"

namespace verdict::common {

// Owning POSIX file descriptor. Closed on destruction.
class FileDescriptor {
 public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) : fd_(fd) {
  }

  FileDescriptor(const FileDescriptor&) = delete;
  auto operator=(const FileDescriptor&) -> FileDescriptor& = delete;

  FileDescriptor(FileDescriptor&& other) noexcept
      : fd_(std::exchange(other.fd_, -1)) {
  }
  auto operator=(FileDescriptor&& other) noexcept -> FileDescriptor& {
    if (this != &other) {
      Close();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  ~FileDescriptor() noexcept {
    Close();
  }

  [[nodiscard]] auto Get() const -> int {
    return fd_;
  }

  [[nodiscard]] auto IsValid() const -> bool {
    return fd_ >= 0;
  }

  void Close() noexcept;

 private:
  int fd_ = -1;
};

// Open an existing file read-only (close-on-exec).
auto OpenForReading(const std::filesystem::path& path)
    -> Result<FileDescriptor>;

// Create or truncate a file for writing (close-on-exec, mode 0600).
auto CreateForWriting(const std::filesystem::path& path)
    -> Result<FileDescriptor>;

}  // namespace verdict::common

#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include "verdict/common/diagnostic.hpp"

namespace verdict::common {

// Exclusively owned, uniquely named temporary directory.
//
// The name comes from mkdtemp, so concurrent owners under the same root never
// collide. The directory and everything in it is removed by Release() or,
// failing that, by the destructor. Move-only.
class ScratchDirectory {
 public:
  // Create "<root>/<prefix>XXXXXX". An empty root means the system temp
  // directory.
  static auto Create(
      const std::filesystem::path& root = {},
      const std::string& prefix = "verdict_") -> Result<ScratchDirectory>;

  ScratchDirectory(const ScratchDirectory&) = delete;
  auto operator=(const ScratchDirectory&) -> ScratchDirectory& = delete;

  ScratchDirectory(ScratchDirectory&& other) noexcept
      : path_(std::exchange(other.path_, {})) {
  }
  auto operator=(ScratchDirectory&& other) noexcept -> ScratchDirectory& {
    if (this != &other) {
      static_cast<void>(Release());
      path_ = std::exchange(other.path_, {});
    }
    return *this;
  }

  ~ScratchDirectory() noexcept {
    static_cast<void>(Release());
  }

  [[nodiscard]] auto Path() const -> const std::filesystem::path& {
    return path_;
  }

  [[nodiscard]] auto IsOwned() const -> bool {
    return !path_.empty();
  }

  // Recursively delete the directory. Ownership is dropped even when removal
  // fails, so the destructor never retries. Returns the removal error, if any.
  [[nodiscard]] auto Release() noexcept -> std::error_code;

 private:
  explicit ScratchDirectory(std::filesystem::path path)
      : path_(std::move(path)) {
  }

  std::filesystem::path path_;
};

}  // namespace verdict::common

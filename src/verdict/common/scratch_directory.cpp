#include "verdict/common/scratch_directory.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "verdict/common/diagnostic.hpp"

namespace verdict::common {

namespace fs = std::filesystem;

auto ScratchDirectory::Create(const fs::path& root, const std::string& prefix)
    -> Result<ScratchDirectory> {
  fs::path base = root;
  if (base.empty()) {
    std::error_code ec;
    base = fs::temp_directory_path(ec);
    if (ec) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format("cannot locate temp directory: {}", ec.message())));
    }
  }

  std::string tmpl = (base / (prefix + "XXXXXX")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');

  if (mkdtemp(buf.data()) == nullptr) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "cannot create scratch directory under '{}': {}",
                base.string(), std::strerror(errno))));
  }
  return ScratchDirectory(fs::path(buf.data()));
}

auto ScratchDirectory::Release() noexcept -> std::error_code {
  fs::path path = std::exchange(path_, {});
  if (path.empty()) {
    return {};
  }
  std::error_code ec;
  fs::remove_all(path, ec);
  return ec;
}

}  // namespace verdict::common

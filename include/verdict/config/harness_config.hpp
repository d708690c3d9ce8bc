#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "verdict/common/diagnostic.hpp"

namespace verdict::config {

inline constexpr std::string_view kConfigFileName = "verdict.toml";

// Settings read from verdict.toml. Unset fields fall back to CLI defaults.
struct HarnessConfig {
  // [subject]
  std::optional<std::filesystem::path> subject;
  std::optional<std::string> search_path;
  std::optional<std::string> search_flag;
  std::vector<std::string> subject_args;

  // [fixtures]
  std::optional<std::string> output_suffix;
  std::optional<std::string> error_suffix;

  // [run]
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<std::filesystem::path> scratch_root;

  // Directory where verdict.toml was found
  std::filesystem::path root_dir;
};

// Search for verdict.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse TOML text. Relative paths resolve against root_dir; source_name is
// used in error messages.
auto ParseConfig(
    std::string_view text, const std::filesystem::path& root_dir,
    std::string_view source_name) -> Result<HarnessConfig>;

// Parse a verdict.toml file.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<HarnessConfig>;

}  // namespace verdict::config

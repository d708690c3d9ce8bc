#include "verdict/config/harness_config.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "verdict/common/diagnostic.hpp"

namespace verdict::config {

namespace fs = std::filesystem;

namespace {

auto ConfigError(std::string_view source, std::string_view message)
    -> Diagnostic {
  return Diagnostic::Config(fmt::format("{}: {}", source, message));
}

// Read an optional scalar; present-but-wrong-type is an error.
template <typename T>
auto ReadOptional(
    toml::node_view<toml::node> node, std::string_view key,
    std::string_view type_name, std::string_view source)
    -> Result<std::optional<T>> {
  if (!node) {
    return std::optional<T>{};
  }
  if (auto value = node.value<T>()) {
    return std::optional<T>(std::move(*value));
  }
  return std::unexpected(
      ConfigError(source, fmt::format("'{}' must be a {}", key, type_name)));
}

auto CheckSection(
    toml::table& tbl, std::string_view name, std::string_view source)
    -> Result<void> {
  auto section = tbl[name];
  if (section && section.as_table() == nullptr) {
    return std::unexpected(
        ConfigError(source, fmt::format("[{}] must be a table", name)));
  }
  return {};
}

// Bare program names stay as-is so they are looked up on PATH.
auto ResolveSubject(const fs::path& subject, const fs::path& root_dir)
    -> fs::path {
  if (subject.is_relative() && subject.has_parent_path()) {
    return root_dir / subject;
  }
  return subject;
}

auto ResolvePath(const fs::path& path, const fs::path& root_dir) -> fs::path {
  if (path.is_relative()) {
    return root_dir / path;
  }
  return path;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto ParseConfig(
    std::string_view text, const fs::path& root_dir,
    std::string_view source_name) -> Result<HarnessConfig> {
  HarnessConfig config;
  config.root_dir = root_dir;

  toml::table tbl;
  try {
    tbl = toml::parse(text, source_name);
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::Config(
            fmt::format(
                "failed to parse {}: {} (line {})", source_name,
                e.description(), e.source().begin.line)));
  }

  for (std::string_view section : {"subject", "fixtures", "run"}) {
    if (auto checked = CheckSection(tbl, section, source_name); !checked) {
      return std::unexpected(std::move(checked.error()));
    }
  }

  // [subject]
  auto subject = tbl["subject"];

  auto executable = ReadOptional<std::string>(
      subject["executable"], "subject.executable", "string", source_name);
  if (!executable) {
    return std::unexpected(std::move(executable.error()));
  }
  if (*executable) {
    if ((*executable)->empty()) {
      return std::unexpected(
          ConfigError(source_name, "'subject.executable' is empty"));
    }
    config.subject = ResolveSubject(**executable, root_dir);
  }

  auto search_path = ReadOptional<std::string>(
      subject["search_path"], "subject.search_path", "string", source_name);
  if (!search_path) {
    return std::unexpected(std::move(search_path.error()));
  }
  if (*search_path) {
    config.search_path = ResolvePath(**search_path, root_dir).string();
  }

  auto search_flag = ReadOptional<std::string>(
      subject["search_flag"], "subject.search_flag", "string", source_name);
  if (!search_flag) {
    return std::unexpected(std::move(search_flag.error()));
  }
  config.search_flag = *search_flag;

  if (auto args = subject["args"]) {
    auto* args_arr = args.as_array();
    if (args_arr == nullptr) {
      return std::unexpected(
          ConfigError(source_name, "'subject.args' must be an array"));
    }
    for (const auto& elem : *args_arr) {
      auto str = elem.value<std::string>();
      if (!str) {
        return std::unexpected(
            ConfigError(
                source_name, "'subject.args' must contain only strings"));
      }
      config.subject_args.push_back(*str);
    }
  }

  // [fixtures]
  auto fixtures = tbl["fixtures"];

  auto output_suffix = ReadOptional<std::string>(
      fixtures["output_suffix"], "fixtures.output_suffix", "string",
      source_name);
  if (!output_suffix) {
    return std::unexpected(std::move(output_suffix.error()));
  }
  config.output_suffix = *output_suffix;

  auto error_suffix = ReadOptional<std::string>(
      fixtures["error_suffix"], "fixtures.error_suffix", "string",
      source_name);
  if (!error_suffix) {
    return std::unexpected(std::move(error_suffix.error()));
  }
  config.error_suffix = *error_suffix;

  if (config.output_suffix && config.error_suffix &&
      *config.output_suffix == *config.error_suffix) {
    return std::unexpected(
        ConfigError(
            source_name,
            "'fixtures.output_suffix' and 'fixtures.error_suffix' must "
            "differ"));
  }

  // [run]
  auto run = tbl["run"];

  auto timeout = ReadOptional<double>(
      run["timeout"], "run.timeout", "number of seconds", source_name);
  if (!timeout) {
    return std::unexpected(std::move(timeout.error()));
  }
  if (*timeout) {
    double seconds = **timeout;
    if (!std::isfinite(seconds) || seconds < 0) {
      return std::unexpected(
          ConfigError(source_name, "'run.timeout' must be >= 0"));
    }
    config.timeout = std::chrono::milliseconds(
        static_cast<int64_t>(std::llround(seconds * 1000.0)));
  }

  auto scratch_root = ReadOptional<std::string>(
      run["scratch_root"], "run.scratch_root", "string", source_name);
  if (!scratch_root) {
    return std::unexpected(std::move(scratch_root.error()));
  }
  if (*scratch_root && !(*scratch_root)->empty()) {
    config.scratch_root = ResolvePath(**scratch_root, root_dir);
  }

  return config;
}

auto LoadConfig(const fs::path& config_path) -> Result<HarnessConfig> {
  std::ifstream in(config_path);
  if (!in) {
    return std::unexpected(
        Diagnostic::Config(
            fmt::format("cannot open config file {}", config_path.string())));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  fs::path root_dir = fs::absolute(config_path).parent_path();
  return ParseConfig(buffer.str(), root_dir, config_path.string());
}

}  // namespace verdict::config

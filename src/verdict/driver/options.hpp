#pragma once

#include <argparse/argparse.hpp>
#include <filesystem>
#include <optional>

#include "verdict/common/diagnostic.hpp"
#include "verdict/config/harness_config.hpp"
#include "verdict/invoker/test_invoker.hpp"

namespace verdict::driver {

inline constexpr auto kSubjectEnvVar = "VERDICT_SUBJECT";
inline constexpr auto kDefaultSearchDir = "imports";

struct RunRequest {
  std::filesystem::path test_path;
  invoker::InvokerOptions options;
};

// Add the test positional and every harness flag.
void AddHarnessArguments(argparse::ArgumentParser& program, int& verbosity);

// Load --config if given, else verdict.toml found from the current directory.
auto LoadOptionalConfig(const argparse::ArgumentParser& program)
    -> Result<std::optional<config::HarnessConfig>>;

// Merge CLI, config, environment and defaults (in that order of precedence).
auto BuildRunRequest(
    const argparse::ArgumentParser& program,
    const std::optional<config::HarnessConfig>& config) -> Result<RunRequest>;

}  // namespace verdict::driver

#include "options.hpp"

#include <argparse/argparse.hpp>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "verdict/common/diagnostic.hpp"
#include "verdict/config/harness_config.hpp"

namespace verdict::driver {

namespace fs = std::filesystem;

void AddHarnessArguments(argparse::ArgumentParser& program, int& verbosity) {
  program.add_argument("test").help("Test case file fed to the subject");
  program.add_argument("-s", "--subject")
      .help("Subject executable (overrides config and $VERDICT_SUBJECT)");
  program.add_argument("-p", "--search-path")
      .help("Value passed with the search flag (default: <test dir>/imports)");
  program.add_argument("--search-flag")
      .help("Flag introducing the search path (default: -p)");
  program.add_argument("-a", "--subject-arg")
      .append()
      .help("Extra subject argument before the search flag (repeatable)");
  program.add_argument("--config").help(
      "Config file (default: nearest verdict.toml)");
  program.add_argument("--scratch-root")
      .help("Directory under which the scratch directory is created");
  program.add_argument("--timeout")
      .scan<'g', double>()
      .help("Kill the subject after this many seconds (0 = no limit)");
  program.add_argument("-v", "--verbose")
      .action([&verbosity](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Log lifecycle details to stderr (repeat for more)");
}

auto LoadOptionalConfig(const argparse::ArgumentParser& program)
    -> Result<std::optional<config::HarnessConfig>> {
  std::optional<fs::path> config_path;
  if (auto explicit_path = program.present<std::string>("--config")) {
    config_path = *explicit_path;
  } else {
    try {
      config_path = config::FindConfig();
    } catch (const fs::filesystem_error& e) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format("cannot search for config: {}", e.what())));
    }
  }
  if (!config_path) {
    return std::optional<config::HarnessConfig>{};
  }

  auto loaded = config::LoadConfig(*config_path);
  if (!loaded) {
    return std::unexpected(std::move(loaded.error()));
  }
  return std::optional<config::HarnessConfig>(std::move(*loaded));
}

auto BuildRunRequest(
    const argparse::ArgumentParser& program,
    const std::optional<config::HarnessConfig>& config) -> Result<RunRequest> {
  RunRequest request;
  request.test_path = program.get<std::string>("test");
  auto& options = request.options;

  // Subject: CLI, config, environment
  if (auto subject = program.present<std::string>("--subject")) {
    options.subject = *subject;
  } else if (config && config->subject) {
    options.subject = *config->subject;
  } else if (const char* env = std::getenv(kSubjectEnvVar);
             env != nullptr && *env != '\0') {
    options.subject = env;
  } else {
    return std::unexpected(
        Diagnostic::Config("no subject executable configured")
            .WithNote(
                fmt::format(
                    "pass --subject, set subject.executable in {}, or set {}",
                    config::kConfigFileName, kSubjectEnvVar)));
  }

  if (auto search_path = program.present<std::string>("--search-path")) {
    options.search_path = *search_path;
  } else if (config && config->search_path) {
    options.search_path = *config->search_path;
  } else {
    options.search_path =
        (request.test_path.parent_path() / kDefaultSearchDir).string();
  }

  if (auto flag = program.present<std::string>("--search-flag")) {
    options.search_flag = *flag;
  } else if (config && config->search_flag) {
    options.search_flag = *config->search_flag;
  }

  // Lists: config first, CLI appended
  if (config) {
    options.subject_args = config->subject_args;
  }
  if (auto args = program.present<std::vector<std::string>>("--subject-arg")) {
    options.subject_args.insert(
        options.subject_args.end(), args->begin(), args->end());
  }

  if (config && config->output_suffix) {
    options.output_suffix = *config->output_suffix;
  }
  if (config && config->error_suffix) {
    options.error_suffix = *config->error_suffix;
  }

  if (auto seconds = program.present<double>("--timeout")) {
    if (!std::isfinite(*seconds) || *seconds < 0) {
      return std::unexpected(
          Diagnostic::Config(
              fmt::format("--timeout must be >= 0, got {}", *seconds)));
    }
    options.timeout = std::chrono::milliseconds(
        static_cast<int64_t>(std::llround(*seconds * 1000.0)));
  } else if (config && config->timeout) {
    options.timeout = *config->timeout;
  }

  if (auto root = program.present<std::string>("--scratch-root")) {
    options.scratch_root = *root;
  } else if (config && config->scratch_root) {
    options.scratch_root = *config->scratch_root;
  }

  return request;
}

}  // namespace verdict::driver

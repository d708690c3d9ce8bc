#include <argparse/argparse.hpp>
#include <exception>
#include <iostream>

#include <spdlog/spdlog.h>

#include "logging.hpp"
#include "options.hpp"
#include "print.hpp"
#include "verdict/common/interrupt_guard.hpp"
#include "verdict/invoker/test_invoker.hpp"

auto main(int argc, char* argv[]) -> int {
  int verbosity = 0;

  argparse::ArgumentParser program("verdict", "0.1.0");
  program.add_description(
      "Run a program on one test case and compare its stdout/stderr with "
      "<test>.out and <test>.err");
  verdict::driver::AddHarnessArguments(program, verbosity);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    verdict::driver::PrintError(err.what());
    std::cerr << program;
    return verdict::invoker::kExitError;
  }

  verdict::driver::ConfigureLogging(verbosity);

  auto config = verdict::driver::LoadOptionalConfig(program);
  if (!config) {
    verdict::driver::PrintDiagnostic(config.error());
    return verdict::invoker::kExitError;
  }
  if (*config) {
    spdlog::debug("using config {}", (*config)->root_dir.string());
  }

  auto request = verdict::driver::BuildRunRequest(program, *config);
  if (!request) {
    verdict::driver::PrintDiagnostic(request.error());
    return verdict::invoker::kExitError;
  }

  verdict::common::InterruptGuard interrupts;
  request->options.interrupts = &interrupts;

  auto report = verdict::invoker::RunTest(request->test_path, request->options);
  verdict::driver::PrintReport(report);

  // Scratch space is gone by now; die the way we were asked to.
  if (int sig = interrupts.PendingSignal(); sig != 0) {
    verdict::common::InterruptGuard::Reraise(sig);
  }
  return report.ExitCode();
}

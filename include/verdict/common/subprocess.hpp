#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "verdict/common/diagnostic.hpp"

namespace verdict::common {

// How a child process ended.
struct ProcessStatus {
  // WEXITSTATUS, or 128 + signal for a signalled child.
  int exit_code = -1;
  std::optional<int> term_signal;
  bool timed_out = false;

  [[nodiscard]] auto Signaled() const -> bool {
    return term_signal.has_value();
  }
};

struct SubprocessRequest {
  // argv[0] = program (PATH lookup), argv[1..n] = arguments. No shell.
  std::vector<std::string> argv;

  // Descriptors dup2'd onto the child's 0/1/2. -1 inherits the parent's.
  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;

  // Zero means wait forever. On expiry the child's process group is killed.
  std::chrono::milliseconds timeout{0};

  // Called with the child pid while SIGINT/SIGTERM/SIGHUP are still blocked,
  // so a signal handler can be pointed at the child before any is delivered.
  std::function<void(pid_t)> on_spawn;
  // Called after the child has been reaped.
  std::function<void()> on_reap;
};

// Spawn the child in its own process group and wait for it to terminate.
// Returns a kSubprocessLaunch diagnostic if the program cannot be started.
// The child's exit status is reported, never interpreted.
auto RunSubprocess(const SubprocessRequest& request) -> Result<ProcessStatus>;

}  // namespace verdict::common

#include "verdict/common/subprocess.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <functional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "verdict/common/diagnostic.hpp"

namespace verdict::common {

namespace {

constexpr std::array<int, 3> kForwardedSignals = {SIGINT, SIGTERM, SIGHUP};
constexpr auto kPollInterval = std::chrono::milliseconds(10);

auto ForwardedSignalSet() -> sigset_t {
  sigset_t set;
  sigemptyset(&set);
  for (int sig : kForwardedSignals) {
    sigaddset(&set, sig);
  }
  return set;
}

// Blocks the forwarded signals for the lifetime of the object.
class ScopedSignalBlock {
 public:
  ScopedSignalBlock() {
    sigset_t set = ForwardedSignalSet();
    pthread_sigmask(SIG_BLOCK, &set, &previous_);
  }
  ~ScopedSignalBlock() {
    pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
  }

  ScopedSignalBlock(const ScopedSignalBlock&) = delete;
  auto operator=(const ScopedSignalBlock&) -> ScopedSignalBlock& = delete;
  ScopedSignalBlock(ScopedSignalBlock&&) = delete;
  auto operator=(ScopedSignalBlock&&) -> ScopedSignalBlock& = delete;

 private:
  sigset_t previous_{};
};

class SpawnAttributes {
 public:
  SpawnAttributes() {
    posix_spawnattr_init(&attr_);
    posix_spawn_file_actions_init(&actions_);
  }
  ~SpawnAttributes() {
    posix_spawn_file_actions_destroy(&actions_);
    posix_spawnattr_destroy(&attr_);
  }

  SpawnAttributes(const SpawnAttributes&) = delete;
  auto operator=(const SpawnAttributes&) -> SpawnAttributes& = delete;
  SpawnAttributes(SpawnAttributes&&) = delete;
  auto operator=(SpawnAttributes&&) -> SpawnAttributes& = delete;

  auto Attr() -> posix_spawnattr_t* {
    return &attr_;
  }
  auto Actions() -> posix_spawn_file_actions_t* {
    return &actions_;
  }

 private:
  posix_spawnattr_t attr_{};
  posix_spawn_file_actions_t actions_{};
};

class ReapNotifier {
 public:
  explicit ReapNotifier(const std::function<void()>& on_reap)
      : on_reap_(on_reap) {
  }
  ~ReapNotifier() {
    if (on_reap_) {
      on_reap_();
    }
  }

  ReapNotifier(const ReapNotifier&) = delete;
  auto operator=(const ReapNotifier&) -> ReapNotifier& = delete;
  ReapNotifier(ReapNotifier&&) = delete;
  auto operator=(ReapNotifier&&) -> ReapNotifier& = delete;

 private:
  const std::function<void()>& on_reap_;
};

auto DecodeWaitStatus(int status) -> ProcessStatus {
  ProcessStatus result;
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

// Blocking waitpid that survives EINTR from our own signal handlers.
auto WaitBlocking(pid_t pid) -> Result<int> {
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format("waitpid() failed: {}", std::strerror(errno))));
    }
  }
  return status;
}

}  // namespace

auto RunSubprocess(const SubprocessRequest& request) -> Result<ProcessStatus> {
  if (request.argv.empty()) {
    return std::unexpected(Diagnostic::SubprocessLaunch("empty argv"));
  }

  // Build argv array (must be null-terminated)
  std::vector<char*> c_argv;
  c_argv.reserve(request.argv.size() + 1);
  for (const auto& arg : request.argv) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  SpawnAttributes spawn;

  // Own process group so signals and timeouts reach the whole subject tree.
  // Reset the signal mask and dispositions we are about to block/override.
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  sigset_t default_set = ForwardedSignalSet();
  posix_spawnattr_setpgroup(spawn.Attr(), 0);
  posix_spawnattr_setsigmask(spawn.Attr(), &empty_mask);
  posix_spawnattr_setsigdefault(spawn.Attr(), &default_set);
  posix_spawnattr_setflags(
      spawn.Attr(), POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK |
                        POSIX_SPAWN_SETSIGDEF);

  if (request.stdin_fd >= 0) {
    posix_spawn_file_actions_adddup2(
        spawn.Actions(), request.stdin_fd, STDIN_FILENO);
  }
  if (request.stdout_fd >= 0) {
    posix_spawn_file_actions_adddup2(
        spawn.Actions(), request.stdout_fd, STDOUT_FILENO);
  }
  if (request.stderr_fd >= 0) {
    posix_spawn_file_actions_adddup2(
        spawn.Actions(), request.stderr_fd, STDERR_FILENO);
  }

  pid_t pid = 0;
  {
    ScopedSignalBlock block;
    int spawn_result = posix_spawnp(
        &pid, c_argv[0], spawn.Actions(), spawn.Attr(), c_argv.data(),
        environ);
    if (spawn_result != 0) {
      return std::unexpected(
          Diagnostic::SubprocessLaunch(
              fmt::format(
                  "cannot execute '{}': {}", request.argv[0],
                  std::strerror(spawn_result))));
    }
    if (request.on_spawn) {
      request.on_spawn(pid);
    }
  }

  // Clears the caller's view of the child on every path out of the wait.
  ReapNotifier notifier{request.on_reap};

  bool timed_out = false;
  int status = 0;

  if (request.timeout.count() > 0) {
    auto deadline = std::chrono::steady_clock::now() + request.timeout;
    while (true) {
      pid_t reaped = waitpid(pid, &status, WNOHANG);
      if (reaped == pid) {
        break;
      }
      if (reaped == -1 && errno != EINTR) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format("waitpid() failed: {}", std::strerror(errno))));
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        kill(-pid, SIGKILL);
        timed_out = true;
        auto waited = WaitBlocking(pid);
        if (!waited) {
          return std::unexpected(std::move(waited.error()));
        }
        status = *waited;
        break;
      }
      std::this_thread::sleep_for(kPollInterval);
    }
  } else {
    auto waited = WaitBlocking(pid);
    if (!waited) {
      return std::unexpected(std::move(waited.error()));
    }
    status = *waited;
  }

  ProcessStatus result = DecodeWaitStatus(status);
  result.timed_out = timed_out;
  return result;
}

}  // namespace verdict::common

#pragma once

#include <array>
#include <csignal>

#include <sys/types.h>

namespace verdict::common {

// Intercepts SIGINT, SIGTERM and SIGHUP for its lifetime.
//
// The handler only records the signal and forwards it to the watched child
// process group, so the harness keeps running, unwinds normally (releasing
// its scratch directory) and can re-raise the signal afterwards. Previous
// dispositions are restored on destruction. One guard per process; the
// signal state is global.
class InterruptGuard {
 public:
  InterruptGuard();
  ~InterruptGuard();

  InterruptGuard(const InterruptGuard&) = delete;
  auto operator=(const InterruptGuard&) -> InterruptGuard& = delete;
  InterruptGuard(InterruptGuard&&) = delete;
  auto operator=(InterruptGuard&&) -> InterruptGuard& = delete;

  // Forward future signals to process group `pgid`. If a signal already
  // arrived, it is forwarded immediately.
  void WatchChild(pid_t pgid);
  void ForgetChild();

  // The first intercepted signal, or 0.
  [[nodiscard]] auto PendingSignal() const -> int;

  // Restore the default disposition for `sig` and raise it.
  static void Reraise(int sig);

 private:
  static constexpr std::array<int, 3> kSignals = {SIGINT, SIGTERM, SIGHUP};

  std::array<struct sigaction, kSignals.size()> previous_{};
};

}  // namespace verdict::common

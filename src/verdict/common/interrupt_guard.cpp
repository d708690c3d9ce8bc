#include "verdict/common/interrupt_guard.hpp"

#include <atomic>
#include <csignal>
#include <cstddef>

#include <sys/types.h>

namespace verdict::common {

namespace {

volatile std::sig_atomic_t g_pending_signal = 0;
std::atomic<pid_t> g_child_pgid{0};

static_assert(std::atomic<pid_t>::is_always_lock_free);

void HandleInterrupt(int sig) {
  if (g_pending_signal == 0) {
    g_pending_signal = sig;
  }
  pid_t pgid = g_child_pgid.load();
  if (pgid > 0) {
    kill(-pgid, sig);
  }
}

}  // namespace

InterruptGuard::InterruptGuard() {
  g_pending_signal = 0;
  g_child_pgid.store(0);

  struct sigaction action {};
  action.sa_handler = HandleInterrupt;
  sigemptyset(&action.sa_mask);
  // No SA_RESTART: blocking waits see EINTR and re-check state.
  action.sa_flags = 0;

  for (size_t i = 0; i < kSignals.size(); ++i) {
    sigaction(kSignals[i], &action, &previous_[i]);
  }
}

InterruptGuard::~InterruptGuard() {
  for (size_t i = 0; i < kSignals.size(); ++i) {
    sigaction(kSignals[i], &previous_[i], nullptr);
  }
  g_child_pgid.store(0);
}

void InterruptGuard::WatchChild(pid_t pgid) {
  g_child_pgid.store(pgid);
  int sig = g_pending_signal;
  if (sig != 0 && pgid > 0) {
    kill(-pgid, sig);
  }
}

void InterruptGuard::ForgetChild() {
  g_child_pgid.store(0);
}

auto InterruptGuard::PendingSignal() const -> int {
  return g_pending_signal;
}

void InterruptGuard::Reraise(int sig) {
  std::signal(sig, SIG_DFL);
  std::raise(sig);
}

}  // namespace verdict::common

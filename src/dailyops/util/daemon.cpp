#include "dailyops/util/daemon.hpp"

#include <csignal>
#include <cstdlib>
#include <unistd.h>

namespace dailyops {

std::atomic<bool> g_shutdown_requested{false};
std::atomic<bool> g_resume_requested{false};

namespace {
std::atomic<std::uint32_t> g_signal_seq{0};

void shutdown_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_signal_seq.fetch_add(1, std::memory_order_release);
  g_signal_seq.notify_all();
}

void resume_handler(int) {
  g_resume_requested.store(true, std::memory_order_release);
  g_signal_seq.fetch_add(1, std::memory_order_release);
  g_signal_seq.notify_all();
}
}  // namespace

auto daemonize() -> bool {
  pid_t pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::exit(0);

  if (setsid() < 0) return false;

  pid = fork();
  if (pid < 0) return false;
  if (pid > 0) std::exit(0);

  close(STDIN_FILENO);
  close(STDOUT_FILENO);
  close(STDERR_FILENO);
  return true;
}

void setup_signal_handlers() {
  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);
  std::signal(SIGUSR1, resume_handler);
  std::signal(SIGCONT, resume_handler);
}

auto wait_for_signal() -> SignalEvent {
  while (true) {
    auto seq = g_signal_seq.load(std::memory_order_acquire);
    if (g_shutdown_requested.load(std::memory_order_acquire)) {
      return SignalEvent::Shutdown;
    }
    if (g_resume_requested.exchange(false, std::memory_order_acq_rel)) {
      return SignalEvent::Resume;
    }
    g_signal_seq.wait(seq, std::memory_order_acquire);
  }
}

}  // namespace dailyops

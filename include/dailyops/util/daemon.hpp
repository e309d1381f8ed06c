#pragma once

#include <atomic>
#include <cstdint>

namespace dailyops {

enum class SignalEvent : std::uint8_t {
  Shutdown,  // SIGINT, SIGTERM
  Resume,    // SIGUSR1, SIGCONT
};

extern std::atomic<bool> g_shutdown_requested;
extern std::atomic<bool> g_resume_requested;

[[nodiscard]] auto daemonize() -> bool;
void setup_signal_handlers();

// Blocks until a handled signal arrives. Shutdown wins over a pending resume.
[[nodiscard]] auto wait_for_signal() -> SignalEvent;

}  // namespace dailyops

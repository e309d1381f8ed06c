#include "dailyops/app/application.hpp"
#include "dailyops/cli/commands.hpp"
#include "dailyops/util/daemon.hpp"
#include "dailyops/util/log.hpp"

#include <chrono>
#include <print>

namespace dailyops::cli {

auto cmd_serve(const ServeOptions& opts) -> int {
  auto result = load_config(opts.common);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  auto config = std::move(*result);

  const auto log_file = opts.log_file.value_or(config.scheduler.log_file);
  if (opts.daemon && log_file.empty()) {
    std::println(
        stderr,
        "Error: --daemon requires log_file (set in config or --log-file)");
    return 1;
  }
  if (!log_file.empty() && !log::set_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }

  if (opts.daemon && !daemonize()) {
    std::println(stderr, "Error: Failed to daemonize");
    return 1;
  }

  log::set_level(config.scheduler.log_level);
  log::start();

  Application app(std::move(config));

  if (auto r = app.open(); !r.has_value()) {
    log::error("Initialization failed: {}", r.error().message());
    log::stop();
    return 1;
  }

  setup_signal_handlers();

  // A process started after the fire time catches up right away.
  auto catch_up = app.on_resume();
  log::info("Startup check: {}", fire_outcome_name(catch_up));

  app.start();
  log::info("dailyops serving, next run at {:%Y-%m-%d %H:%M} UTC",
            std::chrono::floor<std::chrono::minutes>(
                app.trigger().next_fire_time()));

  while (wait_for_signal() == SignalEvent::Resume) {
    auto outcome = app.on_resume();
    log::info("Resume check: {}", fire_outcome_name(outcome));
    app.trigger().wake();
  }

  log::info("Received shutdown signal, stopping...");
  app.stop();

  log::info("dailyops stopped.");
  log::stop();
  return 0;
}

}  // namespace dailyops::cli

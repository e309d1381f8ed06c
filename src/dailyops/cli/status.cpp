#include "dailyops/app/application.hpp"
#include "dailyops/cli/commands.hpp"

#include <chrono>
#include <print>

namespace dailyops::cli {

auto cmd_status(const StatusOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }

  Application app(std::move(*config));
  if (auto r = app.open(); !r.has_value()) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    return 1;
  }

  auto result = app.status();
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  const auto& s = *result;

  std::println("Database:       {}", app.config().storage.db_file);
  std::println("Schema version: {} (target {})", s.schema_version,
               s.target_version);
  std::println("Migration:      {}/{} steps", s.completed_steps.size(),
               s.total_steps);
  for (const auto& entry : s.completed_steps) {
    std::println("  {:>2}. {:<24} {:%Y-%m-%d %H:%M:%S}", entry.position,
                 entry.step_id,
                 std::chrono::floor<std::chrono::seconds>(entry.completed_at));
  }
  std::println("Last run:       {}",
               s.last_run_date ? s.last_run_date->str() : "never");
  std::println("Next run:       {:%Y-%m-%d %H:%M} UTC",
               std::chrono::floor<std::chrono::minutes>(
                   app.trigger().next_fire_time()));
  if (s.last_backup_path) {
    std::println("Last backup:    {}", *s.last_backup_path);
    std::println("Checksum:       {}", s.last_backup_checksum.value_or("-"));
  }

  const auto& c = s.counts;
  std::println("");
  std::println("{:<14} {:>8}", "TABLE", "ROWS");
  std::println("{:<14} {:>8}", "workers", c.workers);
  std::println("{:<14} {:>8}", "buildings", c.buildings);
  std::println("{:<14} {:>8}", "templates", c.templates);
  std::println("{:<14} {:>8}", "assignments", c.assignments);
  std::println("{:<14} {:>8}", "capabilities", c.capabilities);
  std::println("{:<14} {:>8}", "instances", c.instances);
  std::println("{:<14} {:>8}", "sessions", c.sessions);
  std::println("{:<14} {:>8}", "completions", c.completions);
  std::println("{:<14} {:>8}", "attachments", c.attachments);
  return 0;
}

}  // namespace dailyops::cli

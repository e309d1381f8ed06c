#include "dailyops/app/application.hpp"
#include "dailyops/cli/commands.hpp"
#include "dailyops/util/log.hpp"

#include <memory>
#include <print>

namespace dailyops::cli {

namespace {

auto open_app(const CommonOptions& common) -> std::unique_ptr<Application> {
  auto config = load_config(common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return nullptr;
  }
  log::set_level(config->scheduler.log_level);
  log::start();

  auto app = std::make_unique<Application>(std::move(*config));
  if (auto r = app->open(); !r) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    log::stop();
    return nullptr;
  }
  return app;
}

auto print_generation(const GenerationReport& r) -> void {
  std::println("Generated: {} created, {} already existed, {} not due, {} failed",
               r.created, r.skipped_existing, r.skipped_not_due, r.failed);
}

auto print_cleanup(const CleanupReport& r) -> void {
  std::println(
      "Cleanup:   {} instances, {} sessions, {} orphaned attachments removed"
      " ({} failed)",
      r.deleted_instances, r.deleted_sessions, r.deleted_orphaned_attachments,
      r.failed);
}

auto print_migration(const MigrationReport& r) -> void {
  if (!r.ran) {
    std::println("Migration: schema already at version {}", r.from_version);
    return;
  }
  std::println("Migration: version {} -> {} ({} steps run, {} resumed)",
               r.from_version, r.to_version, r.executed.size(),
               r.skipped.size());
  std::println("Checksum:  {}", r.checksum);
  std::println("Backup:    {}{}", r.backup_path,
               r.backup_reused ? " (reused)" : "");
}

}  // namespace

auto cmd_run(const RunOptions& opts) -> int {
  auto app = open_app(opts.common);
  if (!app)
    return 1;

  auto outcome = app->run_daily(opts.force);
  std::println("Run: {}", fire_outcome_name(outcome));
  if (const auto& report = app->pipeline().last_report();
      report && outcome == FireOutcome::Completed) {
    print_migration(report->migration);
    print_generation(report->generation);
    print_cleanup(report->cleanup);
  }
  log::stop();
  return outcome == FireOutcome::Completed ||
                 outcome == FireOutcome::AlreadyRan
             ? 0
             : 1;
}

auto cmd_migrate(const MigrateOptions& opts) -> int {
  auto app = open_app(opts.common);
  if (!app)
    return 1;

  auto report = app->migrate();
  log::stop();
  if (!report) {
    std::println(stderr, "Error: Migration failed: {}",
                 report.error().message());
    if (auto step = app->orchestrator().last_failed_step()) {
      std::println(stderr, "Failed step: {}", *step);
    }
    return 1;
  }
  print_migration(*report);
  return 0;
}

auto cmd_generate(const GenerateOptions& opts) -> int {
  auto app = open_app(opts.common);
  if (!app)
    return 1;

  auto date = app->clock().today();
  if (opts.date) {
    auto parsed = CivilDate::parse(*opts.date);
    if (!parsed) {
      std::println(stderr, "Error: Invalid date '{}' (expected YYYY-MM-DD)",
                   *opts.date);
      log::stop();
      return 1;
    }
    date = *parsed;
  }

  auto report = app->generate(date);
  log::stop();
  if (!report) {
    std::println(stderr, "Error: Generation failed: {}",
                 report.error().message());
    return 1;
  }
  std::println("Date:      {}", date);
  print_generation(*report);
  return report->failed == 0 ? 0 : 1;
}

auto cmd_sweep(const SweepOptions& opts) -> int {
  auto app = open_app(opts.common);
  if (!app)
    return 1;

  auto report = app->sweep(opts.days);
  log::stop();
  if (!report) {
    std::println(stderr, "Error: Cleanup failed: {}", report.error().message());
    return 1;
  }
  print_cleanup(*report);
  return report->failed == 0 ? 0 : 1;
}

}  // namespace dailyops::cli

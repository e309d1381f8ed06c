#include "dailyops/app/daily_pipeline.hpp"

#include "dailyops/util/log.hpp"

namespace dailyops {

DailyPipeline::DailyPipeline(MigrationOrchestrator& orchestrator,
                             InstanceGenerator& generator,
                             RetentionSweeper& sweeper, int retention_days)
    : orchestrator_(orchestrator),
      generator_(generator),
      sweeper_(sweeper),
      retention_days_(retention_days) {
}

auto DailyPipeline::run(CivilDate date) -> Result<PipelineReport> {
  PipelineReport report;

  auto migration = orchestrator_.run_if_needed();
  if (!migration) {
    log::error("Daily pipeline stopped at migration: {}",
               migration.error().message());
    return fail(migration.error());
  }
  report.migration = std::move(*migration);

  auto generation = generator_.generate_for_date(date);
  if (!generation) {
    return fail(generation.error());
  }
  report.generation = *generation;

  auto cleanup = sweeper_.sweep(retention_days_);
  if (!cleanup) {
    log::error("Retention sweep failed: {}", cleanup.error().message());
    return fail(cleanup.error());
  }
  report.cleanup = *cleanup;

  last_report_ = report;
  return report;
}

auto DailyPipeline::migrate(CivilDate today) -> Result<MigrationReport> {
  auto migration = orchestrator_.run_if_needed();
  if (!migration) {
    return fail(migration.error());
  }
  if (migration->ran) {
    if (auto g = generator_.generate_for_date(today); !g) {
      log::warn("Post-migration generation for {} failed: {}", today,
                g.error().message());
    }
  }
  return migration;
}

}  // namespace dailyops

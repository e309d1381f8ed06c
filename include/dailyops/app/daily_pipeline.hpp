#pragma once

#include "dailyops/core/calendar.hpp"
#include "dailyops/core/error.hpp"
#include "dailyops/migration/orchestrator.hpp"
#include "dailyops/scheduler/instance_generator.hpp"
#include "dailyops/scheduler/retention_sweeper.hpp"

#include <optional>

namespace dailyops {

struct PipelineReport {
  MigrationReport migration;
  GenerationReport generation;
  CleanupReport cleanup;
};

// migration (when needed) -> generation -> retention, strictly in sequence.
class DailyPipeline {
public:
  DailyPipeline(MigrationOrchestrator& orchestrator,
                InstanceGenerator& generator, RetentionSweeper& sweeper,
                int retention_days);

  [[nodiscard]] auto run(CivilDate date) -> Result<PipelineReport>;

  // Migration alone, followed by a generation pass for `today` when the
  // migration actually ran.
  [[nodiscard]] auto migrate(CivilDate today) -> Result<MigrationReport>;

  [[nodiscard]] auto last_report() const -> const std::optional<PipelineReport>& {
    return last_report_;
  }

private:
  MigrationOrchestrator& orchestrator_;
  InstanceGenerator& generator_;
  RetentionSweeper& sweeper_;
  int retention_days_;
  std::optional<PipelineReport> last_report_;
};

}  // namespace dailyops

#pragma once

#include "dailyops/app/daily_pipeline.hpp"
#include "dailyops/config/config.hpp"
#include "dailyops/core/calendar.hpp"
#include "dailyops/core/error.hpp"
#include "dailyops/scheduler/daily_trigger.hpp"
#include "dailyops/storage/store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dailyops {

class EventService;
class SqliteStore;

struct StatusReport {
  int schema_version{0};
  int target_version{0};
  std::vector<MigrationLogEntry> completed_steps;
  std::size_t total_steps{0};
  std::optional<CivilDate> last_run_date;
  std::optional<std::string> last_backup_path;
  std::optional<std::string> last_backup_checksum;
  StoreCounts counts;
};

// Application facade - wires the store, the pipeline services and the
// daily trigger from one SystemConfig.
class Application {
public:
  explicit Application(Config config);
  Application(Config config, const Clock& clock);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  [[nodiscard]] auto open() -> Result<void>;

  // Lifecycle of the daily timer
  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;
  auto on_resume() -> FireOutcome;

  // One-shot operations
  auto run_daily(bool force = false) -> FireOutcome;
  [[nodiscard]] auto migrate() -> Result<MigrationReport>;
  [[nodiscard]] auto generate(CivilDate date) -> Result<GenerationReport>;
  [[nodiscard]] auto sweep(std::optional<int> horizon_days = std::nullopt)
      -> Result<CleanupReport>;
  [[nodiscard]] auto status() -> Result<StatusReport>;

  [[nodiscard]] auto config() const noexcept -> const Config&;
  [[nodiscard]] auto clock() const noexcept -> const Clock&;
  [[nodiscard]] auto store() -> Store&;
  [[nodiscard]] auto events() -> EventService&;
  [[nodiscard]] auto trigger() -> DailyTrigger&;
  [[nodiscard]] auto orchestrator() -> MigrationOrchestrator&;
  [[nodiscard]] auto pipeline() -> DailyPipeline&;

private:
  auto init_services() -> void;
  auto load_dataset() const -> Result<OperationalDataset>;

  Config config_;
  std::unique_ptr<Clock> owned_clock_;
  const Clock* clock_;

  std::unique_ptr<SqliteStore> store_;
  std::unique_ptr<EventService> events_;
  std::unique_ptr<MigrationOrchestrator> orchestrator_;
  std::unique_ptr<InstanceGenerator> generator_;
  std::unique_ptr<RetentionSweeper> sweeper_;
  std::unique_ptr<DailyPipeline> pipeline_;
  std::unique_ptr<DailyTrigger> trigger_;
};

}  // namespace dailyops

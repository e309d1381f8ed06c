#pragma once

#include "dailyops/config/system_config.hpp"
#include "dailyops/core/calendar.hpp"
#include "dailyops/core/error.hpp"
#include "dailyops/migration/backup.hpp"
#include "dailyops/migration/migration_step.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dailyops {

class EventService;
class Store;

struct MigrationReport {
  bool ran{false};
  int from_version{0};
  int to_version{0};
  std::vector<StepId> executed;
  std::vector<StepId> skipped;  // already in the migration log
  std::string checksum;
  std::string backup_path;
  bool backup_reused{false};
};

// Settings keys written by the orchestrator.
inline constexpr std::string_view kLastBackupPathKey = "last_backup_path";
inline constexpr std::string_view kLastBackupChecksumKey = "last_backup_checksum";
inline constexpr std::string_view kLastBackupVersionKey = "last_backup_version";

// Moves the operational dataset into the store exactly once per
// installation.
//
// An attempt runs only while the stored schema version is below the target.
// It verifies the dataset checksum, takes (or reuses) a backup, then runs
// the steps inside one exclusive transaction with a savepoint per step. A
// step's migration_log row is written in the step's own savepoint, so a
// step is either fully applied and marked or not applied at all. On a step
// failure the steps completed so far are committed and the next attempt
// resumes at the failed step.
class MigrationOrchestrator {
public:
  using DatasetSource = std::function<Result<OperationalDataset>()>;

  MigrationOrchestrator(Store& store, const Clock& clock,
                        MigrationConfig config, DatasetSource source,
                        std::vector<MigrationStep> steps =
                            default_migration_steps());

  MigrationOrchestrator(const MigrationOrchestrator&) = delete;
  auto operator=(const MigrationOrchestrator&)
      -> MigrationOrchestrator& = delete;

  auto set_event_service(EventService* events) -> void;

  // Busy when another thread is already migrating.
  [[nodiscard]] auto run_if_needed() -> Result<MigrationReport>;

  [[nodiscard]] auto last_failed_step() const -> std::optional<StepId>;
  [[nodiscard]] auto target_version() const noexcept -> int {
    return config_.target_version;
  }
  [[nodiscard]] auto steps() const noexcept
      -> const std::vector<MigrationStep>& {
    return steps_;
  }

private:
  [[nodiscard]] auto known_good_checksum() -> Result<std::optional<std::string>>;
  [[nodiscard]] auto ensure_backup(const OperationalDataset& ds,
                                   const std::string& checksum,
                                   MigrationReport& report) -> Result<void>;
  [[nodiscard]] auto run_steps(const OperationalDataset& ds,
                               MigrationReport& report) -> Result<void>;
  auto abort_transaction() -> void;

  Store& store_;
  const Clock& clock_;
  MigrationConfig config_;
  DatasetSource source_;
  std::vector<MigrationStep> steps_;
  BackupService backups_;
  EventService* events_{nullptr};

  std::mutex run_mutex_;
  mutable std::mutex state_mutex_;
  std::optional<StepId> last_failed_step_;
};

}  // namespace dailyops

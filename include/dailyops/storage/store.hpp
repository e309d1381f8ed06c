#pragma once

#include "dailyops/core/calendar.hpp"
#include "dailyops/core/error.hpp"
#include "dailyops/model/operational_dataset.hpp"
#include "dailyops/model/routine.hpp"
#include "dailyops/util/id.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dailyops {

struct MigrationLogEntry {
  int version{0};
  StepId step_id;
  int position{0};
  std::chrono::system_clock::time_point completed_at{};
};

struct StoreCounts {
  std::size_t workers{0};
  std::size_t buildings{0};
  std::size_t templates{0};
  std::size_t assignments{0};
  std::size_t capabilities{0};
  std::size_t instances{0};
  std::size_t sessions{0};
  std::size_t completions{0};
  std::size_t attachments{0};
};

// Persistence seam for the migration and the daily pipeline.
//
// Insert operations are insert-if-absent and report whether a row was
// actually written; the bool is false when the natural key already existed.
class Store {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  virtual ~Store() = default;

  // Settings
  [[nodiscard]] virtual auto get_setting(std::string_view key)
      -> Result<std::optional<std::string>> = 0;
  [[nodiscard]] virtual auto set_setting(std::string_view key,
                                         std::string_view value)
      -> Result<void> = 0;

  // 0 on a fresh installation.
  [[nodiscard]] virtual auto schema_version() -> Result<int> = 0;
  // Raises the stored version; a lower value leaves it untouched.
  [[nodiscard]] virtual auto advance_schema_version(int version)
      -> Result<void> = 0;

  [[nodiscard]] virtual auto last_run_date()
      -> Result<std::optional<CivilDate>> = 0;
  [[nodiscard]] virtual auto set_last_run_date(CivilDate date)
      -> Result<void> = 0;

  // Transactions
  [[nodiscard]] virtual auto begin_exclusive() -> Result<void> = 0;
  [[nodiscard]] virtual auto commit() -> Result<void> = 0;
  [[nodiscard]] virtual auto rollback() -> Result<void> = 0;
  // Savepoint names must be plain identifiers.
  [[nodiscard]] virtual auto savepoint(std::string_view name)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto release_savepoint(std::string_view name)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto rollback_to_savepoint(std::string_view name)
      -> Result<void> = 0;

  // Migration log
  [[nodiscard]] virtual auto is_step_completed(int version,
                                               const StepId& step)
      -> Result<bool> = 0;
  [[nodiscard]] virtual auto record_step(int version, const StepId& step,
                                         int position, TimePoint at)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto completed_steps(int version)
      -> Result<std::vector<MigrationLogEntry>> = 0;

  // Reference data import
  [[nodiscard]] virtual auto insert_worker(const WorkerRecord& w)
      -> Result<bool> = 0;
  [[nodiscard]] virtual auto insert_building(const BuildingRecord& b)
      -> Result<bool> = 0;
  [[nodiscard]] virtual auto worker_exists(const WorkerId& id)
      -> Result<bool> = 0;
  [[nodiscard]] virtual auto building_exists(const BuildingId& id)
      -> Result<bool> = 0;
  [[nodiscard]] virtual auto insert_template(const RoutineTemplate& tpl)
      -> Result<bool> = 0;
  [[nodiscard]] virtual auto insert_assignment(const WorkerId& worker,
                                               const BuildingId& building,
                                               std::string_view role)
      -> Result<bool> = 0;
  [[nodiscard]] virtual auto upsert_capabilities(
      const WorkerCapabilityRecord& caps) -> Result<void> = 0;
  [[nodiscard]] virtual auto counts() -> Result<StoreCounts> = 0;

  // Templates, ordered by (worker, building, priority desc)
  [[nodiscard]] virtual auto fetch_active_templates()
      -> Result<std::vector<RoutineTemplate>> = 0;
  [[nodiscard]] virtual auto set_template_active(const TemplateId& id,
                                                 bool active)
      -> Result<void> = 0;

  // Instances
  [[nodiscard]] virtual auto instance_exists(const TemplateId& tpl,
                                             CivilDate date)
      -> Result<bool> = 0;
  [[nodiscard]] virtual auto insert_instance(const TaskInstance& inst)
      -> Result<bool> = 0;
  [[nodiscard]] virtual auto list_instances(CivilDate date)
      -> Result<std::vector<TaskInstance>> = 0;
  [[nodiscard]] virtual auto mark_instance_completed(const InstanceId& id,
                                                     TimePoint at)
      -> Result<void> = 0;
  // Completed instances last updated before `cutoff`.
  [[nodiscard]] virtual auto list_expired_instances(TimePoint cutoff)
      -> Result<std::vector<InstanceId>> = 0;
  // Never removes a pending instance; false when nothing was deleted.
  [[nodiscard]] virtual auto delete_completed_instance(const InstanceId& id)
      -> Result<bool> = 0;

  // Work sessions
  [[nodiscard]] virtual auto insert_session(const WorkSession& s)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto close_session(const SessionId& id, TimePoint at)
      -> Result<void> = 0;
  // Closed sessions that ended before `cutoff`.
  [[nodiscard]] virtual auto list_expired_sessions(TimePoint cutoff)
      -> Result<std::vector<SessionId>> = 0;
  [[nodiscard]] virtual auto delete_closed_session(const SessionId& id)
      -> Result<bool> = 0;

  // Completions and attachments
  [[nodiscard]] virtual auto insert_completion(const TaskCompletion& c)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto delete_completion(const CompletionId& id)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto insert_attachment(const Attachment& a)
      -> Result<void> = 0;
  // Attachments whose completion record no longer exists.
  [[nodiscard]] virtual auto list_orphaned_attachments()
      -> Result<std::vector<AttachmentId>> = 0;
  [[nodiscard]] virtual auto delete_attachment(const AttachmentId& id)
      -> Result<bool> = 0;
};

}  // namespace dailyops

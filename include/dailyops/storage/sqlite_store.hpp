#pragma once

#include "dailyops/storage/store.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace dailyops {

class SqliteStore final : public Store {
public:
  explicit SqliteStore(std::string_view db_path);
  ~SqliteStore() override;

  SqliteStore(const SqliteStore&) = delete;
  SqliteStore& operator=(const SqliteStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }
  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return db_path_;
  }

  [[nodiscard]] auto get_setting(std::string_view key)
      -> Result<std::optional<std::string>> override;
  [[nodiscard]] auto set_setting(std::string_view key, std::string_view value)
      -> Result<void> override;
  [[nodiscard]] auto schema_version() -> Result<int> override;
  [[nodiscard]] auto advance_schema_version(int version)
      -> Result<void> override;
  [[nodiscard]] auto last_run_date()
      -> Result<std::optional<CivilDate>> override;
  [[nodiscard]] auto set_last_run_date(CivilDate date) -> Result<void> override;

  [[nodiscard]] auto begin_exclusive() -> Result<void> override;
  [[nodiscard]] auto commit() -> Result<void> override;
  [[nodiscard]] auto rollback() -> Result<void> override;
  [[nodiscard]] auto savepoint(std::string_view name) -> Result<void> override;
  [[nodiscard]] auto release_savepoint(std::string_view name)
      -> Result<void> override;
  [[nodiscard]] auto rollback_to_savepoint(std::string_view name)
      -> Result<void> override;

  [[nodiscard]] auto is_step_completed(int version, const StepId& step)
      -> Result<bool> override;
  [[nodiscard]] auto record_step(int version, const StepId& step, int position,
                                 TimePoint at) -> Result<void> override;
  [[nodiscard]] auto completed_steps(int version)
      -> Result<std::vector<MigrationLogEntry>> override;

  [[nodiscard]] auto insert_worker(const WorkerRecord& w)
      -> Result<bool> override;
  [[nodiscard]] auto insert_building(const BuildingRecord& b)
      -> Result<bool> override;
  [[nodiscard]] auto worker_exists(const WorkerId& id) -> Result<bool> override;
  [[nodiscard]] auto building_exists(const BuildingId& id)
      -> Result<bool> override;
  [[nodiscard]] auto insert_template(const RoutineTemplate& tpl)
      -> Result<bool> override;
  [[nodiscard]] auto insert_assignment(const WorkerId& worker,
                                       const BuildingId& building,
                                       std::string_view role)
      -> Result<bool> override;
  [[nodiscard]] auto upsert_capabilities(const WorkerCapabilityRecord& caps)
      -> Result<void> override;
  [[nodiscard]] auto counts() -> Result<StoreCounts> override;

  [[nodiscard]] auto fetch_active_templates()
      -> Result<std::vector<RoutineTemplate>> override;
  [[nodiscard]] auto set_template_active(const TemplateId& id, bool active)
      -> Result<void> override;

  [[nodiscard]] auto instance_exists(const TemplateId& tpl, CivilDate date)
      -> Result<bool> override;
  [[nodiscard]] auto insert_instance(const TaskInstance& inst)
      -> Result<bool> override;
  [[nodiscard]] auto list_instances(CivilDate date)
      -> Result<std::vector<TaskInstance>> override;
  [[nodiscard]] auto mark_instance_completed(const InstanceId& id,
                                             TimePoint at)
      -> Result<void> override;
  [[nodiscard]] auto list_expired_instances(TimePoint cutoff)
      -> Result<std::vector<InstanceId>> override;
  [[nodiscard]] auto delete_completed_instance(const InstanceId& id)
      -> Result<bool> override;

  [[nodiscard]] auto insert_session(const WorkSession& s)
      -> Result<void> override;
  [[nodiscard]] auto close_session(const SessionId& id, TimePoint at)
      -> Result<void> override;
  [[nodiscard]] auto list_expired_sessions(TimePoint cutoff)
      -> Result<std::vector<SessionId>> override;
  [[nodiscard]] auto delete_closed_session(const SessionId& id)
      -> Result<bool> override;

  [[nodiscard]] auto insert_completion(const TaskCompletion& c)
      -> Result<void> override;
  [[nodiscard]] auto delete_completion(const CompletionId& id)
      -> Result<void> override;
  [[nodiscard]] auto insert_attachment(const Attachment& a)
      -> Result<void> override;
  [[nodiscard]] auto list_orphaned_attachments()
      -> Result<std::vector<AttachmentId>> override;
  [[nodiscard]] auto delete_attachment(const AttachmentId& id)
      -> Result<bool> override;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;
  [[nodiscard]] auto step_done(sqlite3_stmt* stmt, std::string_view what)
      -> Result<void>;
  [[nodiscard]] auto count_rows(const char* sql) -> Result<std::size_t>;
  [[nodiscard]] auto select_ids(const char* sql, std::int64_t cutoff)
      -> Result<std::vector<std::string>>;
  [[nodiscard]] auto delete_by_id(const char* sql, std::string_view id)
      -> Result<bool>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    [[nodiscard]] explicit operator bool() const noexcept {
      return stmt_ != nullptr;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace dailyops

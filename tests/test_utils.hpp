#pragma once

#include "dailyops/core/calendar.hpp"
#include "dailyops/model/operational_dataset.hpp"
#include "dailyops/storage/store.hpp"
#include "dailyops/util/id.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <unistd.h>

namespace dailyops::test {

[[nodiscard]] inline auto worker_id(const char* s) -> WorkerId {
  return WorkerId{std::string{s}};
}

[[nodiscard]] inline auto building_id(const char* s) -> BuildingId {
  return BuildingId{std::string{s}};
}

[[nodiscard]] inline auto template_id(const char* s) -> TemplateId {
  return TemplateId{std::string{s}};
}

[[nodiscard]] inline auto step_id(const char* s) -> StepId {
  return StepId{std::string{s}};
}

[[nodiscard]] inline auto date(int y, unsigned m, unsigned d) -> CivilDate {
  return CivilDate::from_ymd(y, m, d);
}

// Instant `h:m` on day `d` in UTC.
[[nodiscard]] inline auto at(CivilDate d, int h, int m = 0)
    -> std::chrono::system_clock::time_point {
  return d.sys_days() + std::chrono::hours{h} + std::chrono::minutes{m};
}

// Settable clock. The UTC offset is fixed; zero unless set.
class FakeClock final : public Clock {
public:
  explicit FakeClock(TimePoint now = {}) : now_(now.time_since_epoch().count()) {}

  [[nodiscard]] auto now() const -> TimePoint override {
    return TimePoint{TimePoint::duration{now_.load()}};
  }
  [[nodiscard]] auto utc_offset(TimePoint) const
      -> std::chrono::seconds override {
    return std::chrono::seconds{offset_.load()};
  }

  auto set(TimePoint now) -> void { now_.store(now.time_since_epoch().count()); }
  auto advance(TimePoint::duration d) -> void { now_.fetch_add(d.count()); }
  auto set_offset(std::chrono::seconds offset) -> void {
    offset_.store(offset.count());
  }

private:
  std::atomic<TimePoint::rep> now_;
  std::atomic<std::chrono::seconds::rep> offset_{0};
};

// mkstemp-backed path ending in ".db"; the file is removed on destruction.
class TempDbPath {
public:
  TempDbPath() {
    std::string pattern = "/tmp/dailyops_test_XXXXXX";
    int fd = ::mkstemp(pattern.data());
    if (fd >= 0) {
      ::close(fd);
      path_ = pattern + ".db";
      std::filesystem::rename(pattern, path_);
    }
  }
  ~TempDbPath() {
    if (path_.empty())
      return;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    std::filesystem::remove(path_ + "-wal", ec);
    std::filesystem::remove(path_ + "-shm", ec);
  }

  TempDbPath(const TempDbPath&) = delete;
  auto operator=(const TempDbPath&) -> TempDbPath& = delete;

  [[nodiscard]] auto str() const -> const std::string& { return path_; }

private:
  std::string path_;
};

class TempDir {
public:
  TempDir() {
    std::string pattern = "/tmp/dailyops_dir_XXXXXX";
    if (::mkdtemp(pattern.data()) != nullptr) {
      path_ = pattern;
    }
  }
  ~TempDir() {
    if (path_.empty())
      return;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  auto operator=(const TempDir&) -> TempDir& = delete;

  [[nodiscard]] auto path() const -> const std::filesystem::path& {
    return path_;
  }

private:
  std::filesystem::path path_;
};

[[nodiscard]] inline auto files_in(const std::filesystem::path& dir)
    -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> out;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    out.push_back(entry.path());
  }
  return out;
}

// Forwards to a real store; `should_fail(op, key)` returning true makes that
// call fail with DatabaseQueryFailed instead. `op` is the Store method name,
// `key` the natural key of the row (template id for instance operations,
// record id otherwise, empty when there is none).
class FaultyStore final : public Store {
public:
  using Predicate = std::function<bool(std::string_view op, std::string_view key)>;

  explicit FaultyStore(Store& inner) : inner_(inner) {}

  Predicate should_fail = [](std::string_view, std::string_view) {
    return false;
  };

  auto get_setting(std::string_view key)
      -> Result<std::optional<std::string>> override {
    if (fails("get_setting", key))
      return fail(Error::DatabaseQueryFailed);
    return inner_.get_setting(key);
  }
  auto set_setting(std::string_view key, std::string_view value)
      -> Result<void> override {
    if (fails("set_setting", key))
      return fail(Error::DatabaseQueryFailed);
    return inner_.set_setting(key, value);
  }
  auto schema_version() -> Result<int> override {
    if (fails("schema_version", ""))
      return fail(Error::DatabaseQueryFailed);
    return inner_.schema_version();
  }
  auto advance_schema_version(int version) -> Result<void> override {
    if (fails("advance_schema_version", ""))
      return fail(Error::DatabaseQueryFailed);
    return inner_.advance_schema_version(version);
  }
  auto last_run_date() -> Result<std::optional<CivilDate>> override {
    if (fails("last_run_date", ""))
      return fail(Error::DatabaseQueryFailed);
    return inner_.last_run_date();
  }
  auto set_last_run_date(CivilDate d) -> Result<void> override {
    if (fails("set_last_run_date", ""))
      return fail(Error::DatabaseQueryFailed);
    return inner_.set_last_run_date(d);
  }

  auto begin_exclusive() -> Result<void> override {
    if (fails("begin_exclusive", ""))
      return fail(Error::DatabaseQueryFailed);
    return inner_.begin_exclusive();
  }
  auto commit() -> Result<void> override {
    if (fails("commit", ""))
      return fail(Error::DatabaseQueryFailed);
    return inner_.commit();
  }
  auto rollback() -> Result<void> override { return inner_.rollback(); }
  auto savepoint(std::string_view name) -> Result<void> override {
    return inner_.savepoint(name);
  }
  auto release_savepoint(std::string_view name) -> Result<void> override {
    return inner_.release_savepoint(name);
  }
  auto rollback_to_savepoint(std::string_view name) -> Result<void> override {
    return inner_.rollback_to_savepoint(name);
  }

  auto is_step_completed(int version, const StepId& step)
      -> Result<bool> override {
    return inner_.is_step_completed(version, step);
  }
  auto record_step(int version, const StepId& step, int position,
                   TimePoint t) -> Result<void> override {
    if (fails("record_step", step.value()))
      return fail(Error::DatabaseQueryFailed);
    return inner_.record_step(version, step, position, t);
  }
  auto completed_steps(int version)
      -> Result<std::vector<MigrationLogEntry>> override {
    return inner_.completed_steps(version);
  }

  auto insert_worker(const WorkerRecord& w) -> Result<bool> override {
    if (fails("insert_worker", w.id.value()))
      return fail(Error::DatabaseQueryFailed);
    return inner_.insert_worker(w);
  }
  auto insert_building(const BuildingRecord& b) -> Result<bool> override {
    if (fails("insert_building", b.id.value()))
      return fail(Error::DatabaseQueryFailed);
    return inner_.insert_building(b);
  }
  auto worker_exists(const WorkerId& id) -> Result<bool> override {
    return inner_.worker_exists(id);
  }
  auto building_exists(const BuildingId& id) -> Result<bool> override {
    return inner_.building_exists(id);
  }
  auto insert_template(const RoutineTemplate& tpl) -> Result<bool> override {
    if (fails("insert_template", tpl.title))
      return fail(Error::DatabaseQueryFailed);
    return inner_.insert_template(tpl);
  }
  auto insert_assignment(const WorkerId& w, const BuildingId& b,
                         std::string_view role) -> Result<bool> override {
    if (fails("insert_assignment", w.value()))
      return fail(Error::DatabaseQueryFailed);
    return inner_.insert_assignment(w, b, role);
  }
  auto upsert_capabilities(const WorkerCapabilityRecord& caps)
      -> Result<void> override {
    if (fails("upsert_capabilities", caps.worker_id.value()))
      return fail(Error::DatabaseQueryFailed);
    return inner_.upsert_capabilities(caps);
  }
  auto counts() -> Result<StoreCounts> override { return inner_.counts(); }

  auto fetch_active_templates()
      -> Result<std::vector<RoutineTemplate>> override {
    if (fails("fetch_active_templates", ""))
      return fail(Error::DatabaseQueryFailed);
    return inner_.fetch_active_templates();
  }
  auto set_template_active(const TemplateId& id, bool active)
      -> Result<void> override {
    return inner_.set_template_active(id, active);
  }

  auto instance_exists(const TemplateId& tpl, CivilDate d)
      -> Result<bool> override {
    if (fails("instance_exists", tpl.value()))
      return fail(Error::DatabaseQueryFailed);
    return inner_.instance_exists(tpl, d);
  }
  auto insert_instance(const TaskInstance& inst) -> Result<bool> override {
    if (fails("insert_instance", inst.template_id.value()))
      return fail(Error::DatabaseQueryFailed);
    return inner_.insert_instance(inst);
  }
  auto list_instances(CivilDate d)
      -> Result<std::vector<TaskInstance>> override {
    return inner_.list_instances(d);
  }
  auto mark_instance_completed(const InstanceId& id, TimePoint t)
      -> Result<void> override {
    return inner_.mark_instance_completed(id, t);
  }
  auto list_expired_instances(TimePoint cutoff)
      -> Result<std::vector<InstanceId>> override {
    if (fails("list_expired_instances", ""))
      return fail(Error::DatabaseQueryFailed);
    return inner_.list_expired_instances(cutoff);
  }
  auto delete_completed_instance(const InstanceId& id)
      -> Result<bool> override {
    if (fails("delete_completed_instance", id.value()))
      return fail(Error::DatabaseQueryFailed);
    return inner_.delete_completed_instance(id);
  }

  auto insert_session(const WorkSession& s) -> Result<void> override {
    return inner_.insert_session(s);
  }
  auto close_session(const SessionId& id, TimePoint t)
      -> Result<void> override {
    return inner_.close_session(id, t);
  }
  auto list_expired_sessions(TimePoint cutoff)
      -> Result<std::vector<SessionId>> override {
    if (fails("list_expired_sessions", ""))
      return fail(Error::DatabaseQueryFailed);
    return inner_.list_expired_sessions(cutoff);
  }
  auto delete_closed_session(const SessionId& id) -> Result<bool> override {
    if (fails("delete_closed_session", id.value()))
      return fail(Error::DatabaseQueryFailed);
    return inner_.delete_closed_session(id);
  }

  auto insert_completion(const TaskCompletion& c) -> Result<void> override {
    return inner_.insert_completion(c);
  }
  auto delete_completion(const CompletionId& id) -> Result<void> override {
    return inner_.delete_completion(id);
  }
  auto insert_attachment(const Attachment& a) -> Result<void> override {
    return inner_.insert_attachment(a);
  }
  auto list_orphaned_attachments()
      -> Result<std::vector<AttachmentId>> override {
    if (fails("list_orphaned_attachments", ""))
      return fail(Error::DatabaseQueryFailed);
    return inner_.list_orphaned_attachments();
  }
  auto delete_attachment(const AttachmentId& id) -> Result<bool> override {
    if (fails("delete_attachment", id.value()))
      return fail(Error::DatabaseQueryFailed);
    return inner_.delete_attachment(id);
  }

private:
  auto fails(std::string_view op, std::string_view key) const -> bool {
    return should_fail && should_fail(op, key);
  }

  Store& inner_;
};

// Two workers, two buildings, six task rows covering the common recurrence
// forms. On Monday 2025-03-03 (ISO week 10) four rows are due:
//   Lobby Floor Cleaning  daily
//   Trash Area Sweep      daily, gated mon/wed/fri
//   Boiler Blow-Down      weekly, gated mon
//   Stairwell Hose-Down   bi-weekly
// Roof Drain Inspection (monthly) and Weekend Check (weekends) are not.
[[nodiscard]] inline auto sample_dataset() -> OperationalDataset {
  OperationalDataset ds;
  ds.workers = {
      {worker_id("4"), "Kevin Dutan", "kevin.dutan@example.com", "worker",
       "day", true},
      {worker_id("2"), "Edwin Lema", "edwin.lema@example.com", "worker",
       "early", true},
  };
  ds.buildings = {
      {building_id("14"), "Rubin Museum", "150 W 17th St", "museum", 7, true,
       false, 40.7402, -73.9980},
      {building_id("10"), "131 Perry Street", "131 Perry St", "residential",
       5, false, false, 40.7353, -74.0067},
  };

  auto task = [](const char* w, const char* b, std::string title,
                 std::string category, std::string recurrence,
                 std::optional<std::string> days = std::nullopt) {
    TaskAssignment t;
    t.worker_id = worker_id(w);
    t.building_id = building_id(b);
    t.title = std::move(title);
    t.category = std::move(category);
    t.recurrence = std::move(recurrence);
    t.days_of_week = std::move(days);
    return t;
  };
  ds.tasks = {
      task("4", "14", "Lobby Floor Cleaning", "Cleaning", "Daily"),
      task("4", "14", "Trash Area Sweep", "Sanitation", "Daily",
           "mon,wed,fri"),
      task("2", "10", "Boiler Blow-Down", "Maintenance", "Weekly", "mon"),
      task("2", "10", "Roof Drain Inspection", "Inspection", "Monthly"),
      task("2", "14", "Stairwell Hose-Down", "Cleaning", "Bi-Weekly"),
      task("4", "10", "Weekend Check", "Operations", "Weekends"),
  };
  ds.tasks[0].start_hour = 6;
  ds.tasks[0].end_hour = 8;

  ds.capabilities = {
      {worker_id("4"), true, true, true, false, true, false},
      {worker_id("2"), true, true, true, true, true, false},
  };
  return ds;
}

// Polls `pred` until it holds or `timeout` passes.
template <typename Pred>
[[nodiscard]] auto wait_until(Pred pred,
                              std::chrono::milliseconds timeout =
                                  std::chrono::seconds{5}) -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  }
  return pred();
}

template <typename T>
class BlockingQueue {
public:
  void push(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(value));
    cv_.notify_one();
  }

  template <typename Rep, typename Period>
  [[nodiscard]] auto try_pop_for(const std::chrono::duration<Rep, Period>& timeout)
      -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      T value = std::move(queue_.front());
      queue_.pop();
      return value;
    }
    return std::nullopt;
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<T> queue_;
};

}  // namespace dailyops::test

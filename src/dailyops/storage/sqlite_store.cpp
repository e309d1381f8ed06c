#include "dailyops/storage/sqlite_store.hpp"

#include "dailyops/model/state_strings.hpp"
#include "dailyops/util/log.hpp"
#include "dailyops/util/util.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <utility>

namespace dailyops {

namespace {

constexpr std::string_view kSchemaVersionKey = "schema_version";
constexpr std::string_view kLastRunDateKey = "last_run_date";

// Helper to safely get text from sqlite column
auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) -> void {
  sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

auto bind_opt_text(sqlite3_stmt* stmt, int idx,
                   const std::optional<std::string>& value) -> void {
  if (value) {
    bind_text(stmt, idx, *value);
  } else {
    sqlite3_bind_null(stmt, idx);
  }
}

auto is_identifier(std::string_view name) -> bool {
  return !name.empty() && std::ranges::all_of(name, [](unsigned char c) {
    return std::isalnum(c) != 0 || c == '_';
  });
}

auto read_instance(sqlite3_stmt* stmt) -> TaskInstance {
  TaskInstance inst;
  inst.id = InstanceId{col_text(stmt, 0)};
  inst.template_id = TemplateId{col_text(stmt, 1)};
  inst.worker_id = WorkerId{col_text(stmt, 2)};
  inst.building_id = BuildingId{col_text(stmt, 3)};
  if (auto d = CivilDate::parse(col_text(stmt, 4))) {
    inst.scheduled_date = *d;
  }
  inst.status = parse_instance_status(col_text(stmt, 5));
  inst.title = col_text(stmt, 6);
  inst.description = col_text(stmt, 7);
  inst.category = col_text(stmt, 8);
  inst.priority = static_cast<TaskPriority>(sqlite3_column_int(stmt, 9));
  inst.recurrence = col_text(stmt, 10);
  inst.estimated_duration_minutes = sqlite3_column_int(stmt, 11);
  inst.requires_photo = sqlite3_column_int(stmt, 12) != 0;
  inst.created_at = from_timestamp(sqlite3_column_int64(stmt, 13));
  inst.updated_at = from_timestamp(sqlite3_column_int64(stmt, 14));
  return inst;
}

}  // namespace

auto SqliteStore::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

SqliteStore::Statement::~Statement() {
  reset();
}

auto SqliteStore::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

auto SqliteStore::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  if (!db_) {
    log::error("Database is not open: {}", db_path_);
    return fail(Error::DatabaseError);
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

auto SqliteStore::step_done(sqlite3_stmt* stmt, std::string_view what)
    -> Result<void> {
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    log::error("Failed to {}: {}", what, sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

SqliteStore::SqliteStore(std::string_view db_path) : db_path_(db_path) {
}

SqliteStore::~SqliteStore() {
  close();
}

auto SqliteStore::open() -> Result<void> {
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}", sqlite3_errmsg(raw_db));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), 5000);

  // PRAGMA statements may fail on some configurations, but we continue anyway
  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA foreign_keys=ON;"); !r) {
    log::warn("Failed to enable foreign keys: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    close();
    return fail(Error::DatabaseOpenFailed);
  }

  log::info("Database opened: {}", db_path_);
  return ok();
}

auto SqliteStore::close() -> void {
  db_.reset();
}

auto SqliteStore::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS settings (
      key TEXT PRIMARY KEY,
      value TEXT NOT NULL
    );

    CREATE TABLE IF NOT EXISTS migration_log (
      version INTEGER NOT NULL,
      step_id TEXT NOT NULL,
      position INTEGER NOT NULL,
      completed_at INTEGER NOT NULL,
      PRIMARY KEY (version, step_id)
    );

    CREATE TABLE IF NOT EXISTS workers (
      id TEXT PRIMARY KEY,
      name TEXT NOT NULL,
      email TEXT DEFAULT '',
      role TEXT DEFAULT 'worker',
      shift TEXT DEFAULT '',
      is_active INTEGER DEFAULT 1
    );

    CREATE TABLE IF NOT EXISTS buildings (
      id TEXT PRIMARY KEY,
      name TEXT NOT NULL,
      address TEXT DEFAULT '',
      type TEXT DEFAULT 'residential',
      floors INTEGER DEFAULT 1,
      has_elevator INTEGER DEFAULT 0,
      has_doorman INTEGER DEFAULT 0,
      latitude REAL DEFAULT 0,
      longitude REAL DEFAULT 0
    );

    CREATE TABLE IF NOT EXISTS worker_assignments (
      worker_id TEXT NOT NULL,
      building_id TEXT NOT NULL,
      role TEXT NOT NULL DEFAULT 'maintenance',
      PRIMARY KEY (worker_id, building_id)
    );

    CREATE TABLE IF NOT EXISTS worker_capabilities (
      worker_id TEXT PRIMARY KEY,
      can_upload_photos INTEGER DEFAULT 1,
      can_add_notes INTEGER DEFAULT 1,
      can_view_map INTEGER DEFAULT 1,
      can_add_emergency_tasks INTEGER DEFAULT 0,
      requires_photo_for_sanitation INTEGER DEFAULT 1,
      simplified_interface INTEGER DEFAULT 0
    );

    CREATE TABLE IF NOT EXISTS routine_templates (
      id TEXT PRIMARY KEY,
      worker_id TEXT NOT NULL,
      building_id TEXT NOT NULL,
      title TEXT NOT NULL,
      description TEXT DEFAULT '',
      category TEXT DEFAULT '',
      priority INTEGER DEFAULT 1,
      recurrence TEXT NOT NULL DEFAULT 'daily',
      days_of_week TEXT,
      start_hour INTEGER DEFAULT 0,
      end_hour INTEGER DEFAULT 23,
      estimated_duration INTEGER DEFAULT 30,
      requires_photo INTEGER DEFAULT 0,
      is_active INTEGER DEFAULT 1,
      UNIQUE (worker_id, building_id, title)
    );

    CREATE TABLE IF NOT EXISTS task_instances (
      id TEXT PRIMARY KEY,
      template_id TEXT NOT NULL,
      worker_id TEXT NOT NULL,
      building_id TEXT NOT NULL,
      scheduled_date TEXT NOT NULL,
      status TEXT NOT NULL DEFAULT 'pending',
      title TEXT NOT NULL,
      description TEXT DEFAULT '',
      category TEXT DEFAULT '',
      priority INTEGER DEFAULT 1,
      recurrence TEXT DEFAULT '',
      estimated_duration INTEGER DEFAULT 30,
      requires_photo INTEGER DEFAULT 0,
      created_at INTEGER NOT NULL,
      updated_at INTEGER NOT NULL,
      UNIQUE (template_id, scheduled_date),
      FOREIGN KEY (template_id) REFERENCES routine_templates(id)
    );

    CREATE TABLE IF NOT EXISTS work_sessions (
      id TEXT PRIMARY KEY,
      worker_id TEXT NOT NULL,
      building_id TEXT NOT NULL,
      started_at INTEGER NOT NULL,
      ended_at INTEGER
    );

    CREATE TABLE IF NOT EXISTS task_completions (
      id TEXT PRIMARY KEY,
      instance_id TEXT NOT NULL,
      worker_id TEXT NOT NULL,
      completed_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS attachments (
      id TEXT PRIMARY KEY,
      completion_id TEXT NOT NULL,
      path TEXT NOT NULL,
      created_at INTEGER NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_templates_order
      ON routine_templates(worker_id, building_id, priority);
    CREATE INDEX IF NOT EXISTS idx_instances_date
      ON task_instances(scheduled_date);
    CREATE INDEX IF NOT EXISTS idx_instances_status_updated
      ON task_instances(status, updated_at);
    CREATE INDEX IF NOT EXISTS idx_sessions_ended
      ON work_sessions(ended_at);
    CREATE INDEX IF NOT EXISTS idx_attachments_completion
      ON attachments(completion_id);
  )";

  return execute(sql);
}

auto SqliteStore::execute(std::string_view sql) -> Result<void> {
  if (!db_) {
    log::error("Database is not open: {}", db_path_);
    return fail(Error::DatabaseError);
  }
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : sqlite3_errstr(rc));
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

// ---- settings --------------------------------------------------------------

auto SqliteStore::get_setting(std::string_view key)
    -> Result<std::optional<std::string>> {
  auto result = prepare("SELECT value FROM settings WHERE key = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, key);
  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return std::optional<std::string>{col_text(stmt.get(), 0)};
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to read setting {}: {}", key, sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return std::optional<std::string>{};
}

auto SqliteStore::set_setting(std::string_view key, std::string_view value)
    -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO settings (key, value) VALUES (?, ?)
    ON CONFLICT(key) DO UPDATE SET value = excluded.value;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, key);
  bind_text(stmt.get(), 2, value);
  return step_done(stmt.get(), "write setting");
}

auto SqliteStore::schema_version() -> Result<int> {
  auto value = get_setting(kSchemaVersionKey);
  if (!value)
    return std::unexpected(value.error());
  if (!*value)
    return 0;

  int version = 0;
  const auto& s = **value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), version);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    log::error("Corrupt schema_version setting: '{}'", s);
    return fail(Error::DatabaseError);
  }
  return version;
}

auto SqliteStore::advance_schema_version(int version) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO settings (key, value) VALUES ('schema_version', ?)
    ON CONFLICT(key) DO UPDATE SET value = excluded.value
      WHERE CAST(settings.value AS INTEGER) < CAST(excluded.value AS INTEGER);
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  auto text = std::to_string(version);
  bind_text(stmt.get(), 1, text);
  return step_done(stmt.get(), "advance schema version");
}

auto SqliteStore::last_run_date() -> Result<std::optional<CivilDate>> {
  auto value = get_setting(kLastRunDateKey);
  if (!value)
    return std::unexpected(value.error());
  if (!*value)
    return std::optional<CivilDate>{};

  auto date = CivilDate::parse(**value);
  if (!date) {
    log::warn("Ignoring unreadable last_run_date '{}'", **value);
    return std::optional<CivilDate>{};
  }
  return std::optional<CivilDate>{*date};
}

auto SqliteStore::set_last_run_date(CivilDate date) -> Result<void> {
  return set_setting(kLastRunDateKey, date.str());
}

// ---- transactions ----------------------------------------------------------

auto SqliteStore::begin_exclusive() -> Result<void> {
  return execute("BEGIN EXCLUSIVE;");
}

auto SqliteStore::commit() -> Result<void> {
  return execute("COMMIT;");
}

auto SqliteStore::rollback() -> Result<void> {
  return execute("ROLLBACK;");
}

auto SqliteStore::savepoint(std::string_view name) -> Result<void> {
  if (!is_identifier(name))
    return fail(Error::InvalidArgument);
  return execute(std::format("SAVEPOINT {};", name));
}

auto SqliteStore::release_savepoint(std::string_view name) -> Result<void> {
  if (!is_identifier(name))
    return fail(Error::InvalidArgument);
  return execute(std::format("RELEASE SAVEPOINT {};", name));
}

auto SqliteStore::rollback_to_savepoint(std::string_view name)
    -> Result<void> {
  if (!is_identifier(name))
    return fail(Error::InvalidArgument);
  // ROLLBACK TO leaves the savepoint open; release it so the frame is gone.
  if (auto r = execute(std::format("ROLLBACK TO SAVEPOINT {};", name)); !r)
    return r;
  return execute(std::format("RELEASE SAVEPOINT {};", name));
}

// ---- migration log ---------------------------------------------------------

auto SqliteStore::is_step_completed(int version, const StepId& step)
    -> Result<bool> {
  auto result = prepare(
      "SELECT 1 FROM migration_log WHERE version = ? AND step_id = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_int(stmt.get(), 1, version);
  bind_text(stmt.get(), 2, step.value());
  int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_ROW && rc != SQLITE_DONE)
    return fail(Error::DatabaseQueryFailed);
  return rc == SQLITE_ROW;
}

auto SqliteStore::record_step(int version, const StepId& step, int position,
                              TimePoint at) -> Result<void> {
  constexpr auto sql = R"(
    INSERT OR IGNORE INTO migration_log (version, step_id, position, completed_at)
    VALUES (?, ?, ?, ?);
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_int(stmt.get(), 1, version);
  bind_text(stmt.get(), 2, step.value());
  sqlite3_bind_int(stmt.get(), 3, position);
  sqlite3_bind_int64(stmt.get(), 4, to_timestamp(at));
  return step_done(stmt.get(), "record migration step");
}

auto SqliteStore::completed_steps(int version)
    -> Result<std::vector<MigrationLogEntry>> {
  constexpr auto sql = R"(
    SELECT version, step_id, position, completed_at
    FROM migration_log WHERE version = ? ORDER BY position ASC;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_int(stmt.get(), 1, version);

  std::vector<MigrationLogEntry> entries;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    MigrationLogEntry e;
    e.version = sqlite3_column_int(stmt.get(), 0);
    e.step_id = StepId{col_text(stmt.get(), 1)};
    e.position = sqlite3_column_int(stmt.get(), 2);
    e.completed_at = from_timestamp(sqlite3_column_int64(stmt.get(), 3));
    entries.push_back(std::move(e));
  }
  return entries;
}

// ---- reference data --------------------------------------------------------

auto SqliteStore::insert_worker(const WorkerRecord& w) -> Result<bool> {
  constexpr auto sql = R"(
    INSERT OR IGNORE INTO workers (id, name, email, role, shift, is_active)
    VALUES (?, ?, ?, ?, ?, ?);
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, w.id.value());
  bind_text(stmt.get(), 2, w.name);
  bind_text(stmt.get(), 3, w.email);
  bind_text(stmt.get(), 4, w.role);
  bind_text(stmt.get(), 5, w.shift);
  sqlite3_bind_int(stmt.get(), 6, w.active ? 1 : 0);

  if (auto r = step_done(stmt.get(), "insert worker"); !r)
    return std::unexpected(r.error());
  return sqlite3_changes(db_.get()) > 0;
}

auto SqliteStore::insert_building(const BuildingRecord& b) -> Result<bool> {
  constexpr auto sql = R"(
    INSERT OR IGNORE INTO buildings
      (id, name, address, type, floors, has_elevator, has_doorman,
       latitude, longitude)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, b.id.value());
  bind_text(stmt.get(), 2, b.name);
  bind_text(stmt.get(), 3, b.address);
  bind_text(stmt.get(), 4, b.type);
  sqlite3_bind_int(stmt.get(), 5, b.floors);
  sqlite3_bind_int(stmt.get(), 6, b.has_elevator ? 1 : 0);
  sqlite3_bind_int(stmt.get(), 7, b.has_doorman ? 1 : 0);
  sqlite3_bind_double(stmt.get(), 8, b.latitude);
  sqlite3_bind_double(stmt.get(), 9, b.longitude);

  if (auto r = step_done(stmt.get(), "insert building"); !r)
    return std::unexpected(r.error());
  return sqlite3_changes(db_.get()) > 0;
}

auto SqliteStore::worker_exists(const WorkerId& id) -> Result<bool> {
  auto result = prepare("SELECT 1 FROM workers WHERE id = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, id.value());
  int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_ROW && rc != SQLITE_DONE)
    return fail(Error::DatabaseQueryFailed);
  return rc == SQLITE_ROW;
}

auto SqliteStore::building_exists(const BuildingId& id) -> Result<bool> {
  auto result = prepare("SELECT 1 FROM buildings WHERE id = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, id.value());
  int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_ROW && rc != SQLITE_DONE)
    return fail(Error::DatabaseQueryFailed);
  return rc == SQLITE_ROW;
}

auto SqliteStore::insert_template(const RoutineTemplate& tpl) -> Result<bool> {
  constexpr auto sql = R"(
    INSERT OR IGNORE INTO routine_templates
      (id, worker_id, building_id, title, description, category, priority,
       recurrence, days_of_week, start_hour, end_hour, estimated_duration,
       requires_photo, is_active)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, tpl.id.value());
  bind_text(stmt.get(), 2, tpl.worker_id.value());
  bind_text(stmt.get(), 3, tpl.building_id.value());
  bind_text(stmt.get(), 4, tpl.title);
  bind_text(stmt.get(), 5, tpl.description);
  bind_text(stmt.get(), 6, tpl.category);
  sqlite3_bind_int(stmt.get(), 7, std::to_underlying(tpl.priority));
  bind_text(stmt.get(), 8, tpl.recurrence);
  bind_opt_text(stmt.get(), 9, tpl.days_of_week);
  sqlite3_bind_int(stmt.get(), 10, tpl.start_hour);
  sqlite3_bind_int(stmt.get(), 11, tpl.end_hour);
  sqlite3_bind_int(stmt.get(), 12, tpl.estimated_duration_minutes);
  sqlite3_bind_int(stmt.get(), 13, tpl.requires_photo ? 1 : 0);
  sqlite3_bind_int(stmt.get(), 14, tpl.active ? 1 : 0);

  if (auto r = step_done(stmt.get(), "insert template"); !r)
    return std::unexpected(r.error());
  return sqlite3_changes(db_.get()) > 0;
}

auto SqliteStore::insert_assignment(const WorkerId& worker,
                                    const BuildingId& building,
                                    std::string_view role) -> Result<bool> {
  constexpr auto sql = R"(
    INSERT OR IGNORE INTO worker_assignments (worker_id, building_id, role)
    VALUES (?, ?, ?);
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, worker.value());
  bind_text(stmt.get(), 2, building.value());
  bind_text(stmt.get(), 3, role);

  if (auto r = step_done(stmt.get(), "insert assignment"); !r)
    return std::unexpected(r.error());
  return sqlite3_changes(db_.get()) > 0;
}

auto SqliteStore::upsert_capabilities(const WorkerCapabilityRecord& caps)
    -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO worker_capabilities
      (worker_id, can_upload_photos, can_add_notes, can_view_map,
       can_add_emergency_tasks, requires_photo_for_sanitation,
       simplified_interface)
    VALUES (?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(worker_id) DO UPDATE SET
      can_upload_photos = excluded.can_upload_photos,
      can_add_notes = excluded.can_add_notes,
      can_view_map = excluded.can_view_map,
      can_add_emergency_tasks = excluded.can_add_emergency_tasks,
      requires_photo_for_sanitation = excluded.requires_photo_for_sanitation,
      simplified_interface = excluded.simplified_interface;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, caps.worker_id.value());
  sqlite3_bind_int(stmt.get(), 2, caps.can_upload_photos ? 1 : 0);
  sqlite3_bind_int(stmt.get(), 3, caps.can_add_notes ? 1 : 0);
  sqlite3_bind_int(stmt.get(), 4, caps.can_view_map ? 1 : 0);
  sqlite3_bind_int(stmt.get(), 5, caps.can_add_emergency_tasks ? 1 : 0);
  sqlite3_bind_int(stmt.get(), 6, caps.requires_photo_for_sanitation ? 1 : 0);
  sqlite3_bind_int(stmt.get(), 7, caps.simplified_interface ? 1 : 0);
  return step_done(stmt.get(), "upsert capabilities");
}

auto SqliteStore::count_rows(const char* sql) -> Result<std::size_t> {
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    return fail(Error::DatabaseQueryFailed);
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

auto SqliteStore::counts() -> Result<StoreCounts> {
  struct Table {
    const char* sql;
    std::size_t StoreCounts::* field;
  };
  constexpr Table tables[] = {
      {"SELECT COUNT(*) FROM workers;", &StoreCounts::workers},
      {"SELECT COUNT(*) FROM buildings;", &StoreCounts::buildings},
      {"SELECT COUNT(*) FROM routine_templates;", &StoreCounts::templates},
      {"SELECT COUNT(*) FROM worker_assignments;", &StoreCounts::assignments},
      {"SELECT COUNT(*) FROM worker_capabilities;", &StoreCounts::capabilities},
      {"SELECT COUNT(*) FROM task_instances;", &StoreCounts::instances},
      {"SELECT COUNT(*) FROM work_sessions;", &StoreCounts::sessions},
      {"SELECT COUNT(*) FROM task_completions;", &StoreCounts::completions},
      {"SELECT COUNT(*) FROM attachments;", &StoreCounts::attachments},
  };

  StoreCounts counts;
  for (const auto& t : tables) {
    auto n = count_rows(t.sql);
    if (!n)
      return std::unexpected(n.error());
    counts.*t.field = *n;
  }
  return counts;
}

// ---- templates -------------------------------------------------------------

auto SqliteStore::fetch_active_templates()
    -> Result<std::vector<RoutineTemplate>> {
  constexpr auto sql = R"(
    SELECT id, worker_id, building_id, title, description, category, priority,
           recurrence, days_of_week, start_hour, end_hour, estimated_duration,
           requires_photo, is_active
    FROM routine_templates
    WHERE is_active = 1
    ORDER BY worker_id ASC, building_id ASC, priority DESC, title ASC;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  std::vector<RoutineTemplate> templates;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    RoutineTemplate t;
    t.id = TemplateId{col_text(stmt.get(), 0)};
    t.worker_id = WorkerId{col_text(stmt.get(), 1)};
    t.building_id = BuildingId{col_text(stmt.get(), 2)};
    t.title = col_text(stmt.get(), 3);
    t.description = col_text(stmt.get(), 4);
    t.category = col_text(stmt.get(), 5);
    t.priority = static_cast<TaskPriority>(sqlite3_column_int(stmt.get(), 6));
    t.recurrence = col_text(stmt.get(), 7);
    if (sqlite3_column_type(stmt.get(), 8) != SQLITE_NULL) {
      t.days_of_week = col_text(stmt.get(), 8);
    }
    t.start_hour = sqlite3_column_int(stmt.get(), 9);
    t.end_hour = sqlite3_column_int(stmt.get(), 10);
    t.estimated_duration_minutes = sqlite3_column_int(stmt.get(), 11);
    t.requires_photo = sqlite3_column_int(stmt.get(), 12) != 0;
    t.active = sqlite3_column_int(stmt.get(), 13) != 0;
    templates.push_back(std::move(t));
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to fetch templates: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return templates;
}

auto SqliteStore::set_template_active(const TemplateId& id, bool active)
    -> Result<void> {
  auto result =
      prepare("UPDATE routine_templates SET is_active = ? WHERE id = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_int(stmt.get(), 1, active ? 1 : 0);
  bind_text(stmt.get(), 2, id.value());
  if (auto r = step_done(stmt.get(), "update template"); !r)
    return r;
  if (sqlite3_changes(db_.get()) == 0)
    return fail(Error::NotFound);
  return ok();
}

// ---- instances -------------------------------------------------------------

auto SqliteStore::instance_exists(const TemplateId& tpl, CivilDate date)
    -> Result<bool> {
  auto result = prepare(
      "SELECT 1 FROM task_instances WHERE template_id = ? AND scheduled_date = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, tpl.value());
  bind_text(stmt.get(), 2, date.str());
  int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_ROW && rc != SQLITE_DONE)
    return fail(Error::DatabaseQueryFailed);
  return rc == SQLITE_ROW;
}

auto SqliteStore::insert_instance(const TaskInstance& inst) -> Result<bool> {
  constexpr auto sql = R"(
    INSERT INTO task_instances
      (id, template_id, worker_id, building_id, scheduled_date, status, title,
       description, category, priority, recurrence, estimated_duration,
       requires_photo, created_at, updated_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(template_id, scheduled_date) DO NOTHING;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, inst.id.value());
  bind_text(stmt.get(), 2, inst.template_id.value());
  bind_text(stmt.get(), 3, inst.worker_id.value());
  bind_text(stmt.get(), 4, inst.building_id.value());
  bind_text(stmt.get(), 5, inst.scheduled_date.str());
  bind_text(stmt.get(), 6, instance_status_name(inst.status));
  bind_text(stmt.get(), 7, inst.title);
  bind_text(stmt.get(), 8, inst.description);
  bind_text(stmt.get(), 9, inst.category);
  sqlite3_bind_int(stmt.get(), 10, std::to_underlying(inst.priority));
  bind_text(stmt.get(), 11, inst.recurrence);
  sqlite3_bind_int(stmt.get(), 12, inst.estimated_duration_minutes);
  sqlite3_bind_int(stmt.get(), 13, inst.requires_photo ? 1 : 0);
  sqlite3_bind_int64(stmt.get(), 14, to_timestamp(inst.created_at));
  sqlite3_bind_int64(stmt.get(), 15, to_timestamp(inst.updated_at));

  if (auto r = step_done(stmt.get(), "insert instance"); !r)
    return std::unexpected(r.error());
  return sqlite3_changes(db_.get()) > 0;
}

auto SqliteStore::list_instances(CivilDate date)
    -> Result<std::vector<TaskInstance>> {
  constexpr auto sql = R"(
    SELECT id, template_id, worker_id, building_id, scheduled_date, status,
           title, description, category, priority, recurrence,
           estimated_duration, requires_photo, created_at, updated_at
    FROM task_instances WHERE scheduled_date = ?
    ORDER BY worker_id ASC, building_id ASC, priority DESC;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, date.str());

  std::vector<TaskInstance> instances;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    instances.push_back(read_instance(stmt.get()));
  }
  return instances;
}

auto SqliteStore::mark_instance_completed(const InstanceId& id, TimePoint at)
    -> Result<void> {
  auto result = prepare(
      "UPDATE task_instances SET status = 'completed', updated_at = ? WHERE id = ?;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_int64(stmt.get(), 1, to_timestamp(at));
  bind_text(stmt.get(), 2, id.value());
  if (auto r = step_done(stmt.get(), "complete instance"); !r)
    return r;
  if (sqlite3_changes(db_.get()) == 0)
    return fail(Error::NotFound);
  return ok();
}

auto SqliteStore::select_ids(const char* sql, std::int64_t cutoff)
    -> Result<std::vector<std::string>> {
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_int64(stmt.get(), 1, cutoff);

  std::vector<std::string> ids;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    ids.push_back(col_text(stmt.get(), 0));
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to list expired records: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ids;
}

auto SqliteStore::delete_by_id(const char* sql, std::string_view id)
    -> Result<bool> {
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, id);
  if (auto r = step_done(stmt.get(), "delete record"); !r)
    return std::unexpected(r.error());
  return sqlite3_changes(db_.get()) > 0;
}

auto SqliteStore::list_expired_instances(TimePoint cutoff)
    -> Result<std::vector<InstanceId>> {
  auto ids = select_ids(
      "SELECT id FROM task_instances WHERE status = 'completed' AND updated_at < ?;",
      to_timestamp(cutoff));
  if (!ids)
    return std::unexpected(ids.error());

  std::vector<InstanceId> out;
  out.reserve(ids->size());
  for (auto& id : *ids) {
    out.emplace_back(std::move(id));
  }
  return out;
}

auto SqliteStore::delete_completed_instance(const InstanceId& id)
    -> Result<bool> {
  return delete_by_id(
      "DELETE FROM task_instances WHERE id = ? AND status = 'completed';",
      id.value());
}

// ---- sessions --------------------------------------------------------------

auto SqliteStore::insert_session(const WorkSession& s) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO work_sessions (id, worker_id, building_id, started_at, ended_at)
    VALUES (?, ?, ?, ?, ?);
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, s.id.value());
  bind_text(stmt.get(), 2, s.worker_id.value());
  bind_text(stmt.get(), 3, s.building_id.value());
  sqlite3_bind_int64(stmt.get(), 4, to_timestamp(s.started_at));
  if (s.ended_at) {
    sqlite3_bind_int64(stmt.get(), 5, to_timestamp(*s.ended_at));
  } else {
    sqlite3_bind_null(stmt.get(), 5);
  }
  return step_done(stmt.get(), "insert session");
}

auto SqliteStore::close_session(const SessionId& id, TimePoint at)
    -> Result<void> {
  auto result = prepare(
      "UPDATE work_sessions SET ended_at = ? WHERE id = ? AND ended_at IS NULL;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  sqlite3_bind_int64(stmt.get(), 1, to_timestamp(at));
  bind_text(stmt.get(), 2, id.value());
  if (auto r = step_done(stmt.get(), "close session"); !r)
    return r;
  if (sqlite3_changes(db_.get()) == 0)
    return fail(Error::NotFound);
  return ok();
}

auto SqliteStore::list_expired_sessions(TimePoint cutoff)
    -> Result<std::vector<SessionId>> {
  auto ids = select_ids(
      "SELECT id FROM work_sessions WHERE ended_at IS NOT NULL AND ended_at < ?;",
      to_timestamp(cutoff));
  if (!ids)
    return std::unexpected(ids.error());

  std::vector<SessionId> out;
  out.reserve(ids->size());
  for (auto& id : *ids) {
    out.emplace_back(std::move(id));
  }
  return out;
}

auto SqliteStore::delete_closed_session(const SessionId& id) -> Result<bool> {
  return delete_by_id(
      "DELETE FROM work_sessions WHERE id = ? AND ended_at IS NOT NULL;",
      id.value());
}

// ---- completions & attachments ---------------------------------------------

auto SqliteStore::insert_completion(const TaskCompletion& c) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO task_completions (id, instance_id, worker_id, completed_at)
    VALUES (?, ?, ?, ?);
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, c.id.value());
  bind_text(stmt.get(), 2, c.instance_id.value());
  bind_text(stmt.get(), 3, c.worker_id.value());
  sqlite3_bind_int64(stmt.get(), 4, to_timestamp(c.completed_at));
  return step_done(stmt.get(), "insert completion");
}

auto SqliteStore::delete_completion(const CompletionId& id) -> Result<void> {
  auto deleted =
      delete_by_id("DELETE FROM task_completions WHERE id = ?;", id.value());
  if (!deleted)
    return std::unexpected(deleted.error());
  if (!*deleted)
    return fail(Error::NotFound);
  return ok();
}

auto SqliteStore::insert_attachment(const Attachment& a) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO attachments (id, completion_id, path, created_at)
    VALUES (?, ?, ?, ?);
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, a.id.value());
  bind_text(stmt.get(), 2, a.completion_id.value());
  bind_text(stmt.get(), 3, a.path);
  sqlite3_bind_int64(stmt.get(), 4, to_timestamp(a.created_at));
  return step_done(stmt.get(), "insert attachment");
}

auto SqliteStore::list_orphaned_attachments()
    -> Result<std::vector<AttachmentId>> {
  constexpr auto sql = R"(
    SELECT id FROM attachments
    WHERE NOT EXISTS (
      SELECT 1 FROM task_completions c
      WHERE c.id = attachments.completion_id);
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  std::vector<AttachmentId> ids;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    ids.emplace_back(col_text(stmt.get(), 0));
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to list orphaned attachments: {}",
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ids;
}

auto SqliteStore::delete_attachment(const AttachmentId& id) -> Result<bool> {
  return delete_by_id("DELETE FROM attachments WHERE id = ?;", id.value());
}

}  // namespace dailyops

#include "dailyops/model/routine.hpp"
#include "dailyops/storage/sqlite_store.hpp"

#include <sqlite3.h>

#include <memory>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace dailyops;
using namespace std::chrono_literals;
using test::at;
using test::date;

class SqliteStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(db_path_.str().empty());
    store_ = std::make_unique<SqliteStore>(db_path_.str());
  }

  void TearDown() override { store_.reset(); }

  test::TempDbPath db_path_;
  std::unique_ptr<SqliteStore> store_;
};

class OpenSqliteStoreTest : public SqliteStoreTest {
protected:
  void SetUp() override {
    SqliteStoreTest::SetUp();
    ASSERT_TRUE(store_->open().has_value());
  }

  void TearDown() override {
    store_->close();
    SqliteStoreTest::TearDown();
  }

  auto seed_reference_data() -> void {
    auto ds = test::sample_dataset();
    for (const auto& w : ds.workers) {
      ASSERT_TRUE(store_->insert_worker(w).has_value());
    }
    for (const auto& b : ds.buildings) {
      ASSERT_TRUE(store_->insert_building(b).has_value());
    }
  }

  auto make_template(const char* id, const char* title,
                     TaskPriority priority = TaskPriority::Normal)
      -> RoutineTemplate {
    RoutineTemplate tpl;
    tpl.id = test::template_id(id);
    tpl.worker_id = test::worker_id("4");
    tpl.building_id = test::building_id("14");
    tpl.title = title;
    tpl.category = "Cleaning";
    tpl.priority = priority;
    return tpl;
  }
};

TEST_F(SqliteStoreTest, InitialState_IsNotOpen) {
  EXPECT_FALSE(store_->is_open());
}

TEST_F(SqliteStoreTest, Open_Succeeds) {
  auto result = store_->open();

  EXPECT_TRUE(result.has_value());
  EXPECT_TRUE(store_->is_open());
}

TEST_F(SqliteStoreTest, DoubleOpen_IsIdempotent) {
  ASSERT_TRUE(store_->open().has_value());

  EXPECT_TRUE(store_->open().has_value());
}

TEST_F(SqliteStoreTest, QueryBeforeOpen_IsDatabaseError) {
  auto result = store_->schema_version();

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::DatabaseError));
}

TEST_F(SqliteStoreTest, Open_BadPath_Fails) {
  SqliteStore bad("/nonexistent_dir_for_dailyops/x.db");

  auto result = bad.open();

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::DatabaseOpenFailed));
}

TEST_F(OpenSqliteStoreTest, Settings_RoundTrip) {
  EXPECT_FALSE(store_->get_setting("k").value().has_value());

  ASSERT_TRUE(store_->set_setting("k", "v1").has_value());
  EXPECT_EQ(store_->get_setting("k").value(), "v1");

  ASSERT_TRUE(store_->set_setting("k", "v2").has_value());
  EXPECT_EQ(store_->get_setting("k").value(), "v2");
}

TEST_F(OpenSqliteStoreTest, SchemaVersion_StartsAtZero) {
  EXPECT_EQ(store_->schema_version().value(), 0);
}

TEST_F(OpenSqliteStoreTest, AdvanceSchemaVersion_NeverLowers) {
  ASSERT_TRUE(store_->advance_schema_version(2).has_value());
  EXPECT_EQ(store_->schema_version().value(), 2);

  ASSERT_TRUE(store_->advance_schema_version(1).has_value());
  EXPECT_EQ(store_->schema_version().value(), 2);

  ASSERT_TRUE(store_->advance_schema_version(3).has_value());
  EXPECT_EQ(store_->schema_version().value(), 3);
}

TEST_F(OpenSqliteStoreTest, LastRunDate_RoundTrip) {
  EXPECT_FALSE(store_->last_run_date().value().has_value());

  ASSERT_TRUE(store_->set_last_run_date(date(2025, 3, 3)).has_value());

  EXPECT_EQ(store_->last_run_date().value(), date(2025, 3, 3));
}

TEST_F(OpenSqliteStoreTest, Reopen_KeepsData) {
  ASSERT_TRUE(store_->advance_schema_version(1).has_value());
  store_->close();

  ASSERT_TRUE(store_->open().has_value());
  EXPECT_EQ(store_->schema_version().value(), 1);
}

TEST_F(OpenSqliteStoreTest, MigrationLog_RecordAndQuery) {
  auto now = at(date(2025, 3, 3), 0, 1);
  ASSERT_TRUE(store_->record_step(1, test::step_id("b"), 2, now).has_value());
  ASSERT_TRUE(store_->record_step(1, test::step_id("a"), 1, now).has_value());
  // Recording twice is harmless
  ASSERT_TRUE(store_->record_step(1, test::step_id("a"), 1, now).has_value());

  EXPECT_TRUE(store_->is_step_completed(1, test::step_id("a")).value());
  EXPECT_FALSE(store_->is_step_completed(2, test::step_id("a")).value());
  EXPECT_FALSE(store_->is_step_completed(1, test::step_id("c")).value());

  auto steps = store_->completed_steps(1);
  ASSERT_TRUE(steps.has_value());
  ASSERT_EQ(steps->size(), 2u);
  EXPECT_EQ((*steps)[0].step_id, test::step_id("a"));
  EXPECT_EQ((*steps)[1].step_id, test::step_id("b"));
  EXPECT_EQ((*steps)[0].completed_at, now);
}

TEST_F(OpenSqliteStoreTest, Savepoint_RollbackDiscardsOnlyInnerWork) {
  ASSERT_TRUE(store_->begin_exclusive().has_value());
  ASSERT_TRUE(store_->set_setting("outer", "1").has_value());

  ASSERT_TRUE(store_->savepoint("step").has_value());
  ASSERT_TRUE(store_->set_setting("inner", "1").has_value());
  ASSERT_TRUE(store_->rollback_to_savepoint("step").has_value());

  ASSERT_TRUE(store_->commit().has_value());

  EXPECT_TRUE(store_->get_setting("outer").value().has_value());
  EXPECT_FALSE(store_->get_setting("inner").value().has_value());
}

TEST_F(OpenSqliteStoreTest, Savepoint_RejectsNonIdentifier) {
  auto result = store_->savepoint("x; DROP TABLE settings");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::InvalidArgument));
}

TEST_F(OpenSqliteStoreTest, Rollback_DiscardsTransaction) {
  ASSERT_TRUE(store_->begin_exclusive().has_value());
  ASSERT_TRUE(store_->set_setting("k", "v").has_value());
  ASSERT_TRUE(store_->rollback().has_value());

  EXPECT_FALSE(store_->get_setting("k").value().has_value());
}

TEST_F(OpenSqliteStoreTest, InsertWorker_IsInsertIfAbsent) {
  auto w = test::sample_dataset().workers[0];

  EXPECT_TRUE(store_->insert_worker(w).value());
  w.name = "Renamed";
  EXPECT_FALSE(store_->insert_worker(w).value());

  EXPECT_TRUE(store_->worker_exists(w.id).value());
  EXPECT_FALSE(store_->worker_exists(test::worker_id("99")).value());
  EXPECT_EQ(store_->counts().value().workers, 1u);
}

TEST_F(OpenSqliteStoreTest, InsertBuilding_IsInsertIfAbsent) {
  auto b = test::sample_dataset().buildings[0];

  EXPECT_TRUE(store_->insert_building(b).value());
  EXPECT_FALSE(store_->insert_building(b).value());
  EXPECT_TRUE(store_->building_exists(b.id).value());
}

TEST_F(OpenSqliteStoreTest, InsertTemplate_UniqueOnWorkerBuildingTitle) {
  seed_reference_data();

  EXPECT_TRUE(store_->insert_template(make_template("t1", "Mop")).value());
  // Different id, same natural key
  EXPECT_FALSE(store_->insert_template(make_template("t2", "Mop")).value());
  EXPECT_TRUE(store_->insert_template(make_template("t3", "Sweep")).value());

  EXPECT_EQ(store_->counts().value().templates, 2u);
}

TEST_F(OpenSqliteStoreTest, FetchActiveTemplates_OrderedAndFiltered) {
  seed_reference_data();
  ASSERT_TRUE(store_->insert_template(make_template("t1", "Low", TaskPriority::Low)).value());
  ASSERT_TRUE(store_->insert_template(make_template("t2", "Urgent", TaskPriority::Urgent)).value());
  auto gated = make_template("t3", "Gated", TaskPriority::High);
  gated.days_of_week = "mon,fri";
  gated.recurrence = "weekly";
  ASSERT_TRUE(store_->insert_template(gated).value());
  ASSERT_TRUE(store_->insert_template(make_template("t4", "Off")).value());
  ASSERT_TRUE(store_->set_template_active(test::template_id("t4"), false).has_value());

  auto templates = store_->fetch_active_templates();

  ASSERT_TRUE(templates.has_value());
  ASSERT_EQ(templates->size(), 3u);
  EXPECT_EQ((*templates)[0].title, "Urgent");
  EXPECT_EQ((*templates)[1].title, "Gated");
  EXPECT_EQ((*templates)[1].days_of_week, "mon,fri");
  EXPECT_EQ((*templates)[1].recurrence, "weekly");
  EXPECT_EQ((*templates)[2].title, "Low");
  EXPECT_FALSE((*templates)[2].days_of_week.has_value());
}

TEST_F(OpenSqliteStoreTest, SetTemplateActive_Unknown_IsNotFound) {
  auto result = store_->set_template_active(test::template_id("nope"), false);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::NotFound));
}

TEST_F(OpenSqliteStoreTest, Assignments_AndCapabilities) {
  seed_reference_data();
  auto w = test::worker_id("4");
  auto b = test::building_id("14");

  EXPECT_TRUE(store_->insert_assignment(w, b, "maintenance").value());
  EXPECT_FALSE(store_->insert_assignment(w, b, "maintenance").value());

  auto caps = test::sample_dataset().capabilities[0];
  ASSERT_TRUE(store_->upsert_capabilities(caps).has_value());
  caps.simplified_interface = true;
  ASSERT_TRUE(store_->upsert_capabilities(caps).has_value());

  auto counts = store_->counts().value();
  EXPECT_EQ(counts.assignments, 1u);
  EXPECT_EQ(counts.capabilities, 1u);
}

TEST_F(OpenSqliteStoreTest, InsertInstance_UniqueOnTemplateAndDate) {
  seed_reference_data();
  auto tpl = make_template("t1", "Mop");
  ASSERT_TRUE(store_->insert_template(tpl).value());
  auto d = date(2025, 3, 3);

  auto first = make_instance(tpl, d, at(d, 0, 1));
  auto second = make_instance(tpl, d, at(d, 0, 2));
  ASSERT_NE(first.id, second.id);

  EXPECT_TRUE(store_->insert_instance(first).value());
  EXPECT_FALSE(store_->insert_instance(second).value());
  EXPECT_TRUE(store_->instance_exists(tpl.id, d).value());
  EXPECT_FALSE(store_->instance_exists(tpl.id, d.add_days(1)).value());

  auto listed = store_->list_instances(d);
  ASSERT_TRUE(listed.has_value());
  ASSERT_EQ(listed->size(), 1u);
  EXPECT_EQ((*listed)[0].id, first.id);
  EXPECT_EQ((*listed)[0].status, InstanceStatus::Pending);
  EXPECT_EQ((*listed)[0].scheduled_date, d);
  EXPECT_EQ((*listed)[0].title, "Mop");
}

TEST_F(OpenSqliteStoreTest, InsertInstance_UnknownTemplate_Fails) {
  auto d = date(2025, 3, 3);
  auto inst = make_instance(make_template("ghost", "Ghost"), d, at(d, 0));

  EXPECT_FALSE(store_->insert_instance(inst).has_value());
}

TEST_F(OpenSqliteStoreTest, ExpiredInstances_OnlyCompletedAndOld) {
  seed_reference_data();
  auto tpl = make_template("t1", "Mop");
  ASSERT_TRUE(store_->insert_template(tpl).value());

  auto old_day = date(2024, 1, 1);
  auto old_done = make_instance(tpl, old_day, at(old_day, 0));
  auto old_pending = make_instance(tpl, old_day.add_days(1), at(old_day, 0));
  auto fresh_done = make_instance(tpl, date(2025, 3, 1), at(date(2025, 3, 1), 0));
  for (const auto* inst : {&old_done, &old_pending, &fresh_done}) {
    ASSERT_TRUE(store_->insert_instance(*inst).value());
  }
  ASSERT_TRUE(store_->mark_instance_completed(old_done.id, at(old_day, 12)).has_value());
  ASSERT_TRUE(store_->mark_instance_completed(fresh_done.id, at(date(2025, 3, 1), 12)).has_value());

  auto expired = store_->list_expired_instances(at(date(2025, 1, 1), 0));

  ASSERT_TRUE(expired.has_value());
  ASSERT_EQ(expired->size(), 1u);
  EXPECT_EQ((*expired)[0], old_done.id);

  // The delete is guarded by status
  EXPECT_FALSE(store_->delete_completed_instance(old_pending.id).value());
  EXPECT_TRUE(store_->delete_completed_instance(old_done.id).value());
  EXPECT_EQ(store_->counts().value().instances, 2u);
}

TEST_F(OpenSqliteStoreTest, Sessions_OnlyClosedAreExpired) {
  auto t0 = at(date(2024, 1, 1), 8);
  WorkSession open{SessionId{"open"}, test::worker_id("4"), test::building_id("14"), t0, std::nullopt};
  WorkSession closed{SessionId{"closed"}, test::worker_id("4"), test::building_id("14"), t0, t0 + 4h};
  ASSERT_TRUE(store_->insert_session(open).has_value());
  ASSERT_TRUE(store_->insert_session(closed).has_value());

  auto expired = store_->list_expired_sessions(at(date(2025, 1, 1), 0));

  ASSERT_TRUE(expired.has_value());
  ASSERT_EQ(expired->size(), 1u);
  EXPECT_EQ((*expired)[0], SessionId{"closed"});
  EXPECT_FALSE(store_->delete_closed_session(SessionId{"open"}).value());
  EXPECT_TRUE(store_->delete_closed_session(SessionId{"closed"}).value());

  ASSERT_TRUE(store_->close_session(SessionId{"open"}, t0 + 1h).has_value());
  EXPECT_EQ(store_->close_session(SessionId{"open"}, t0 + 2h).error(),
            make_error_code(Error::NotFound));
}

TEST_F(OpenSqliteStoreTest, OrphanedAttachments) {
  auto t0 = at(date(2025, 3, 3), 9);
  TaskCompletion c{CompletionId{"c1"}, InstanceId{"i1"}, test::worker_id("4"), t0};
  ASSERT_TRUE(store_->insert_completion(c).has_value());
  ASSERT_TRUE(store_->insert_attachment({AttachmentId{"a1"}, CompletionId{"c1"}, "/photos/a1.jpg", t0}).has_value());
  ASSERT_TRUE(store_->insert_attachment({AttachmentId{"a2"}, CompletionId{"c2"}, "/photos/a2.jpg", t0}).has_value());

  auto orphans = store_->list_orphaned_attachments();
  ASSERT_TRUE(orphans.has_value());
  ASSERT_EQ(orphans->size(), 1u);
  EXPECT_EQ((*orphans)[0], AttachmentId{"a2"});

  ASSERT_TRUE(store_->delete_completion(CompletionId{"c1"}).has_value());
  EXPECT_EQ(store_->list_orphaned_attachments().value().size(), 2u);

  EXPECT_TRUE(store_->delete_attachment(AttachmentId{"a1"}).value());
  EXPECT_FALSE(store_->delete_attachment(AttachmentId{"a1"}).value());
}

TEST_F(OpenSqliteStoreTest, OrphanedAttachments_SurviveNullCompletionId) {
  auto t0 = at(date(2025, 3, 3), 9);
  ASSERT_TRUE(store_->insert_attachment({AttachmentId{"a1"}, CompletionId{"c1"}, "/photos/a1.jpg", t0}).has_value());

  // A TEXT primary key admits NULL; written from a second connection.
  sqlite3* raw = nullptr;
  ASSERT_EQ(sqlite3_open(db_path_.str().c_str(), &raw), SQLITE_OK);
  EXPECT_EQ(sqlite3_exec(raw,
                         "INSERT INTO task_completions "
                         "(id, instance_id, worker_id, completed_at) "
                         "VALUES (NULL, 'i9', '4', 0);",
                         nullptr, nullptr, nullptr),
            SQLITE_OK);
  sqlite3_close(raw);

  auto orphans = store_->list_orphaned_attachments();
  ASSERT_TRUE(orphans.has_value());
  ASSERT_EQ(orphans->size(), 1u);
  EXPECT_EQ((*orphans)[0], AttachmentId{"a1"});
}

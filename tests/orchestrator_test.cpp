#include "dailyops/app/services/event_service.hpp"
#include "dailyops/migration/checksum.hpp"
#include "dailyops/migration/orchestrator.hpp"
#include "dailyops/storage/sqlite_store.hpp"

#include <algorithm>
#include <fstream>
#include <future>
#include <thread>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace dailyops;

class OrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(store_.open().has_value());
    config_.target_version = 1;
    config_.backup_dir = (backups_.path() / "backups").string();
  }

  auto make(Store& store, std::vector<MigrationStep> steps =
                              default_migration_steps())
      -> std::unique_ptr<MigrationOrchestrator> {
    return std::make_unique<MigrationOrchestrator>(
        store, clock_, config_,
        [this]() -> Result<OperationalDataset> { return dataset_; },
        std::move(steps));
  }

  auto backup_files() const -> std::size_t {
    auto dir = backups_.path() / "backups";
    return std::filesystem::exists(dir) ? test::files_in(dir).size() : 0;
  }

  test::TempDbPath db_path_;
  SqliteStore store_{db_path_.str()};
  test::TempDir backups_;
  test::FakeClock clock_{test::at(test::date(2025, 3, 3), 0, 1)};
  MigrationConfig config_;
  OperationalDataset dataset_ = test::sample_dataset();
};

TEST_F(OrchestratorTest, FreshInstall_RunsEveryStep) {
  auto orch = make(store_);

  auto report = orch->run_if_needed();

  ASSERT_TRUE(report.has_value()) << report.error().message();
  EXPECT_TRUE(report->ran);
  EXPECT_EQ(report->from_version, 0);
  EXPECT_EQ(report->to_version, 1);
  EXPECT_EQ(report->executed.size(), 5u);
  EXPECT_TRUE(report->skipped.empty());
  EXPECT_EQ(report->checksum, compute_checksum(dataset_).value());
  EXPECT_FALSE(report->backup_reused);
  EXPECT_TRUE(std::filesystem::exists(report->backup_path));

  EXPECT_EQ(store_.schema_version().value(), 1);
  auto counts = store_.counts().value();
  EXPECT_EQ(counts.workers, 2u);
  EXPECT_EQ(counts.buildings, 2u);
  EXPECT_EQ(counts.templates, 6u);
  EXPECT_EQ(counts.assignments, 4u);
  EXPECT_EQ(counts.capabilities, 2u);

  auto log = store_.completed_steps(1).value();
  ASSERT_EQ(log.size(), 5u);
  EXPECT_EQ(log[0].step_id, test::step_id("import_workers"));
  EXPECT_EQ(log[4].step_id, test::step_id("setup_capabilities"));
  EXPECT_EQ(log[4].position, 5);

  EXPECT_EQ(store_.get_setting(kLastBackupPathKey).value(), report->backup_path);
  EXPECT_EQ(store_.get_setting(kLastBackupChecksumKey).value(), report->checksum);
  EXPECT_EQ(store_.get_setting(kLastBackupVersionKey).value(), "1");
}

TEST_F(OrchestratorTest, ImportedTemplates_CarryDerivedPriority) {
  ASSERT_TRUE(make(store_)->run_if_needed().has_value());

  auto templates = store_.fetch_active_templates().value();
  auto find = [&](std::string_view title) {
    return std::ranges::find(templates, title, &RoutineTemplate::title);
  };
  ASSERT_NE(find("Roof Drain Inspection"), templates.end());
  EXPECT_EQ(find("Roof Drain Inspection")->priority, TaskPriority::High);
  EXPECT_EQ(find("Trash Area Sweep")->priority, TaskPriority::High);
  EXPECT_EQ(find("Lobby Floor Cleaning")->priority, TaskPriority::Normal);
  EXPECT_EQ(find("Lobby Floor Cleaning")->start_hour, 6);
  EXPECT_EQ(find("Weekend Check")->end_hour, 23);
}

TEST_F(OrchestratorTest, SecondRun_IsNoOp) {
  auto orch = make(store_);
  ASSERT_TRUE(orch->run_if_needed().has_value());
  auto before = store_.counts().value();

  auto report = orch->run_if_needed();

  ASSERT_TRUE(report.has_value());
  EXPECT_FALSE(report->ran);
  EXPECT_EQ(report->from_version, 1);
  EXPECT_TRUE(report->executed.empty());
  EXPECT_EQ(store_.counts().value().templates, before.templates);
  EXPECT_EQ(backup_files(), 1u);
}

TEST_F(OrchestratorTest, StepFailure_KeepsCompletedSteps) {
  test::FaultyStore faulty(store_);
  faulty.should_fail = [](std::string_view op, std::string_view key) {
    return op == "insert_template" && key == "Boiler Blow-Down";
  };
  auto orch = make(faulty);

  auto report = orch->run_if_needed();

  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::StepExecutionFailed));
  EXPECT_EQ(orch->last_failed_step(), test::step_id("import_templates"));
  EXPECT_EQ(store_.schema_version().value(), 0);

  auto log = store_.completed_steps(1).value();
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[0].step_id, test::step_id("import_workers"));
  EXPECT_EQ(log[1].step_id, test::step_id("import_buildings"));

  // The failed step left nothing behind, including rows it wrote before
  // the failing one.
  auto counts = store_.counts().value();
  EXPECT_EQ(counts.workers, 2u);
  EXPECT_EQ(counts.buildings, 2u);
  EXPECT_EQ(counts.templates, 0u);
}

TEST_F(OrchestratorTest, Retry_ResumesAtFailedStep_AndReusesBackup) {
  test::FaultyStore faulty(store_);
  bool failing = true;
  faulty.should_fail = [&](std::string_view op, std::string_view) {
    return failing && op == "insert_assignment";
  };
  auto orch = make(faulty);
  auto first = orch->run_if_needed();
  ASSERT_FALSE(first.has_value());
  auto first_backup = store_.get_setting(kLastBackupPathKey).value();
  ASSERT_TRUE(first_backup.has_value());

  failing = false;
  auto report = orch->run_if_needed();

  ASSERT_TRUE(report.has_value()) << report.error().message();
  EXPECT_TRUE(report->ran);
  ASSERT_EQ(report->skipped.size(), 3u);
  ASSERT_EQ(report->executed.size(), 2u);
  EXPECT_EQ(report->executed[0], test::step_id("create_assignments"));
  EXPECT_EQ(report->executed[1], test::step_id("setup_capabilities"));
  EXPECT_TRUE(report->backup_reused);
  EXPECT_EQ(report->backup_path, *first_backup);
  EXPECT_EQ(backup_files(), 1u);
  EXPECT_FALSE(orch->last_failed_step().has_value());

  EXPECT_EQ(store_.schema_version().value(), 1);
  auto counts = store_.counts().value();
  EXPECT_EQ(counts.templates, 6u);
  EXPECT_EQ(counts.assignments, 4u);
}

TEST_F(OrchestratorTest, Retry_WithMissingBackupFile_TakesNewBackup) {
  test::FaultyStore faulty(store_);
  bool failing = true;
  faulty.should_fail = [&](std::string_view op, std::string_view) {
    return failing && op == "upsert_capabilities";
  };
  auto orch = make(faulty);
  ASSERT_FALSE(orch->run_if_needed().has_value());
  auto first_backup = store_.get_setting(kLastBackupPathKey).value().value();
  std::filesystem::remove(first_backup);

  failing = false;
  auto report = orch->run_if_needed();

  ASSERT_TRUE(report.has_value());
  EXPECT_FALSE(report->backup_reused);
  EXPECT_NE(report->backup_path, first_backup);
  EXPECT_TRUE(std::filesystem::exists(report->backup_path));
}

TEST_F(OrchestratorTest, DatasetChangedBetweenAttempts_IsIntegrityFailure) {
  test::FaultyStore faulty(store_);
  bool failing = true;
  faulty.should_fail = [&](std::string_view op, std::string_view) {
    return failing && op == "insert_assignment";
  };
  auto orch = make(faulty);
  ASSERT_FALSE(orch->run_if_needed().has_value());

  failing = false;
  dataset_.tasks[0].title = "Lobby Floor Mopping";
  auto report = orch->run_if_needed();

  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::IntegrityCheckFailed));
  EXPECT_EQ(store_.schema_version().value(), 0);
  EXPECT_EQ(store_.completed_steps(1).value().size(), 3u);
}

TEST_F(OrchestratorTest, PinnedChecksumMismatch_AbortsBeforeAnyWrite) {
  config_.expected_checksum = std::string(64, '0');
  auto orch = make(store_);

  auto report = orch->run_if_needed();

  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::IntegrityCheckFailed));
  EXPECT_EQ(backup_files(), 0u);
  EXPECT_EQ(store_.counts().value().workers, 0u);
  EXPECT_TRUE(store_.completed_steps(1).value().empty());
}

TEST_F(OrchestratorTest, PinnedChecksumMatch_Runs) {
  config_.expected_checksum = compute_checksum(dataset_).value();
  auto orch = make(store_);

  auto report = orch->run_if_needed();

  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(report->ran);
}

TEST_F(OrchestratorTest, BackupFailure_AbortsBeforeAnyStep) {
  auto blocker = backups_.path() / "blocker";
  std::ofstream(blocker) << "x";
  config_.backup_dir = (blocker / "backups").string();
  auto orch = make(store_);

  auto report = orch->run_if_needed();

  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::BackupFailed));
  EXPECT_EQ(store_.schema_version().value(), 0);
  EXPECT_TRUE(store_.completed_steps(1).value().empty());
  EXPECT_EQ(store_.counts().value().workers, 0u);
}

TEST_F(OrchestratorTest, DatasetSourceFailure_IsPropagated) {
  auto orch = std::make_unique<MigrationOrchestrator>(
      store_, clock_, config_,
      []() -> Result<OperationalDataset> { return fail(Error::FileNotFound); });

  auto report = orch->run_if_needed();

  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::FileNotFound));
  EXPECT_EQ(backup_files(), 0u);
}

TEST_F(OrchestratorTest, NewTargetVersion_RunsStepsAgain) {
  ASSERT_TRUE(make(store_)->run_if_needed().has_value());

  config_.target_version = 2;
  auto report = make(store_)->run_if_needed();

  ASSERT_TRUE(report.has_value()) << report.error().message();
  EXPECT_TRUE(report->ran);
  EXPECT_EQ(report->from_version, 1);
  EXPECT_EQ(report->to_version, 2);
  EXPECT_EQ(report->executed.size(), 5u);
  EXPECT_EQ(store_.schema_version().value(), 2);
  // Re-running insert-if-absent steps adds nothing
  EXPECT_EQ(store_.counts().value().templates, 6u);
  EXPECT_EQ(backup_files(), 2u);
}

TEST_F(OrchestratorTest, Steps_AreInsertIfAbsent) {
  for (const auto& step : default_migration_steps()) {
    auto first = step.action(store_, dataset_);
    ASSERT_TRUE(first.has_value()) << step.id;
    auto second = step.action(store_, dataset_);
    ASSERT_TRUE(second.has_value()) << step.id;
    if (step.id != test::step_id("setup_capabilities")) {
      EXPECT_EQ(second->inserted, 0u) << step.id;
    }
  }
  auto counts = store_.counts().value();
  EXPECT_EQ(counts.workers, 2u);
  EXPECT_EQ(counts.templates, 6u);
  EXPECT_EQ(counts.assignments, 4u);
}

TEST_F(OrchestratorTest, TemplatesWithUnknownReferences_AreSkipped) {
  dataset_.tasks[0].worker_id = test::worker_id("99");

  auto report = make(store_)->run_if_needed();

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(store_.counts().value().templates, 5u);
}

TEST_F(OrchestratorTest, EmitsMigrationCompleted) {
  EventService events{clock_};
  std::vector<EventMessage> seen;
  events.subscribe([&](const EventMessage& ev) { seen.push_back(ev); });
  auto orch = make(store_);
  orch->set_event_service(&events);

  ASSERT_TRUE(orch->run_if_needed().has_value());
  ASSERT_TRUE(orch->run_if_needed().has_value());

  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].event, "migration_completed");
}

TEST_F(OrchestratorTest, ConcurrentRun_IsBusy) {
  std::promise<void> entered;
  std::promise<void> release;
  auto release_future = release.get_future().share();

  auto steps = default_migration_steps();
  steps.insert(steps.begin(),
               MigrationStep{test::step_id("gate"),
                             [&, release_future](Store&, const OperationalDataset&)
                                 -> Result<StepOutcome> {
                               entered.set_value();
                               release_future.wait();
                               return StepOutcome{};
                             }});
  auto orch = make(store_, std::move(steps));

  std::thread first([&] { EXPECT_TRUE(orch->run_if_needed().has_value()); });
  entered.get_future().wait();

  auto second = orch->run_if_needed();
  release.set_value();
  first.join();

  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error(), make_error_code(Error::Busy));
  EXPECT_EQ(store_.schema_version().value(), 1);
}

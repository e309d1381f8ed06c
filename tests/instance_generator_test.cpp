#include "dailyops/app/services/event_service.hpp"
#include "dailyops/migration/migration_step.hpp"
#include "dailyops/scheduler/instance_generator.hpp"
#include "dailyops/storage/sqlite_store.hpp"

#include <algorithm>
#include <ranges>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace dailyops;

class InstanceGeneratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(store_.open().has_value());
    auto ds = test::sample_dataset();
    for (const auto& step : default_migration_steps()) {
      ASSERT_TRUE(step.action(store_, ds).has_value()) << step.id;
    }
  }

  auto template_named(std::string_view title) -> RoutineTemplate {
    auto templates = store_.fetch_active_templates().value();
    auto it = std::ranges::find(templates, title, &RoutineTemplate::title);
    EXPECT_NE(it, templates.end()) << title;
    return it == templates.end() ? RoutineTemplate{} : *it;
  }

  test::TempDbPath db_path_;
  SqliteStore store_{db_path_.str()};
  test::FakeClock clock_{test::at(test::date(2025, 3, 3), 0, 1)};
};

TEST_F(InstanceGeneratorTest, Monday_CreatesDueInstances) {
  InstanceGenerator gen(store_, clock_);
  auto monday = test::date(2025, 3, 3);

  auto report = gen.generate_for_date(monday);

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->created, 4u);
  EXPECT_EQ(report->skipped_existing, 0u);
  EXPECT_EQ(report->skipped_not_due, 2u);
  EXPECT_EQ(report->failed, 0u);

  auto instances = store_.list_instances(monday).value();
  ASSERT_EQ(instances.size(), 4u);
  for (const auto& inst : instances) {
    EXPECT_EQ(inst.status, InstanceStatus::Pending);
    EXPECT_EQ(inst.scheduled_date, monday);
  }
  auto titles = instances | std::views::transform(&TaskInstance::title);
  EXPECT_NE(std::ranges::find(titles, "Boiler Blow-Down"), titles.end());
  EXPECT_EQ(std::ranges::find(titles, "Weekend Check"), titles.end());
}

TEST_F(InstanceGeneratorTest, InstanceCopiesTemplateFields) {
  InstanceGenerator gen(store_, clock_);
  auto monday = test::date(2025, 3, 3);
  ASSERT_TRUE(gen.generate_for_date(monday).has_value());
  auto tpl = template_named("Trash Area Sweep");

  auto instances = store_.list_instances(monday).value();
  auto it = std::ranges::find(instances, tpl.id, &TaskInstance::template_id);
  ASSERT_NE(it, instances.end());
  EXPECT_EQ(it->worker_id, tpl.worker_id);
  EXPECT_EQ(it->building_id, tpl.building_id);
  EXPECT_EQ(it->category, "Sanitation");
  EXPECT_EQ(it->priority, TaskPriority::High);
  EXPECT_TRUE(it->created_at == clock_.now());
}

TEST_F(InstanceGeneratorTest, SecondRun_CreatesNothing) {
  InstanceGenerator gen(store_, clock_);
  auto monday = test::date(2025, 3, 3);
  ASSERT_TRUE(gen.generate_for_date(monday).has_value());

  auto report = gen.generate_for_date(monday);

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->created, 0u);
  EXPECT_EQ(report->skipped_existing, 4u);
  EXPECT_EQ(report->skipped_not_due, 2u);
  EXPECT_EQ(store_.list_instances(monday).value().size(), 4u);
}

TEST_F(InstanceGeneratorTest, DifferentDays_AreIndependent) {
  InstanceGenerator gen(store_, clock_);

  auto tuesday = gen.generate_for_date(test::date(2025, 3, 4));
  auto saturday = gen.generate_for_date(test::date(2025, 3, 1));

  ASSERT_TRUE(tuesday.has_value());
  ASSERT_TRUE(saturday.has_value());
  EXPECT_EQ(tuesday->created, 1u);
  EXPECT_EQ(tuesday->skipped_not_due, 5u);
  EXPECT_EQ(saturday->created, 3u);
  EXPECT_TRUE(store_.list_instances(test::date(2025, 3, 3)).value().empty());
}

TEST_F(InstanceGeneratorTest, OddWeekMonday_WeeklyDueButBiWeeklyNot) {
  InstanceGenerator gen(store_, clock_);
  auto monday = test::date(2025, 3, 10);

  auto report = gen.generate_for_date(monday);

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->created, 3u);
  EXPECT_EQ(report->skipped_not_due, 3u);

  auto instances = store_.list_instances(monday).value();
  auto titles = instances | std::views::transform(&TaskInstance::title);
  EXPECT_NE(std::ranges::find(titles, "Boiler Blow-Down"), titles.end());
  EXPECT_EQ(std::ranges::find(titles, "Stairwell Hose-Down"), titles.end());
}

TEST_F(InstanceGeneratorTest, InactiveTemplate_IsNotGenerated) {
  auto tpl = template_named("Lobby Floor Cleaning");
  ASSERT_TRUE(store_.set_template_active(tpl.id, false).has_value());
  InstanceGenerator gen(store_, clock_);

  auto report = gen.generate_for_date(test::date(2025, 3, 3));

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->created, 3u);
  EXPECT_EQ(report->skipped_not_due, 2u);
}

TEST_F(InstanceGeneratorTest, TemplateFailure_IsCountedAndOthersProceed) {
  auto tpl = template_named("Boiler Blow-Down");
  test::FaultyStore faulty(store_);
  faulty.should_fail = [id = tpl.id.value()](std::string_view op,
                                             std::string_view key) {
    return op == "insert_instance" && key == id;
  };
  InstanceGenerator gen(faulty, clock_);

  auto report = gen.generate_for_date(test::date(2025, 3, 3));

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->created, 3u);
  EXPECT_EQ(report->failed, 1u);
  EXPECT_FALSE(store_.instance_exists(tpl.id, test::date(2025, 3, 3)).value());
}

TEST_F(InstanceGeneratorTest, ExistenceLookupFailure_IsCounted) {
  test::FaultyStore faulty(store_);
  faulty.should_fail = [](std::string_view op, std::string_view) {
    return op == "instance_exists";
  };
  InstanceGenerator gen(faulty, clock_);

  auto report = gen.generate_for_date(test::date(2025, 3, 3));

  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->created, 0u);
  EXPECT_EQ(report->failed, 4u);
}

TEST_F(InstanceGeneratorTest, TemplateFetchFailure_IsDatabaseError) {
  test::FaultyStore faulty(store_);
  faulty.should_fail = [](std::string_view op, std::string_view) {
    return op == "fetch_active_templates";
  };
  InstanceGenerator gen(faulty, clock_);

  auto report = gen.generate_for_date(test::date(2025, 3, 3));

  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), make_error_code(Error::DatabaseError));
}

TEST_F(InstanceGeneratorTest, EmitsGenerationAndMetricsEvents) {
  EventService events{clock_};
  std::vector<EventMessage> seen;
  events.subscribe([&](const EventMessage& ev) { seen.push_back(ev); });
  InstanceGenerator gen(store_, clock_);
  gen.set_event_service(&events);

  ASSERT_TRUE(gen.generate_for_date(test::date(2025, 3, 3)).has_value());

  // One generation summary plus one invalidation per touched building
  ASSERT_EQ(seen.size(), 3u);
  EXPECT_EQ(seen[0].event, "instances_generated");
  EXPECT_EQ(seen[1].event, "metrics_invalidated");
  EXPECT_EQ(seen[2].event, "metrics_invalidated");
}

TEST_F(InstanceGeneratorTest, NothingCreated_InvalidatesNothing) {
  EventService events{clock_};
  std::vector<EventMessage> seen;
  InstanceGenerator gen(store_, clock_);
  ASSERT_TRUE(gen.generate_for_date(test::date(2025, 3, 3)).has_value());
  events.subscribe([&](const EventMessage& ev) { seen.push_back(ev); });
  gen.set_event_service(&events);

  ASSERT_TRUE(gen.generate_for_date(test::date(2025, 3, 3)).has_value());

  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].event, "instances_generated");
}

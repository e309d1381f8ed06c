#include "dailyops/migration/migration_step.hpp"

#include "dailyops/storage/store.hpp"
#include "dailyops/util/log.hpp"
#include "dailyops/util/util.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <string>
#include <utility>

namespace dailyops {

namespace {

auto lower(std::string_view s) -> std::string {
  std::string out{s};
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

// Both ends of a task row must already be imported.
auto references_resolve(Store& store, const TaskAssignment& t)
    -> Result<bool> {
  auto worker = store.worker_exists(t.worker_id);
  if (!worker)
    return std::unexpected(worker.error());
  auto building = store.building_exists(t.building_id);
  if (!building)
    return std::unexpected(building.error());
  return *worker && *building;
}

}  // namespace

auto derive_priority(std::string_view title, std::string_view category)
    -> TaskPriority {
  auto t = lower(title);
  if (t.contains("emergency")) {
    return TaskPriority::Urgent;
  }
  if (t.contains("inspection") || t.contains("compliance")) {
    return TaskPriority::High;
  }
  if (lower(category) == "sanitation") {
    return TaskPriority::High;
  }
  return TaskPriority::Normal;
}

auto import_workers(Store& store, const OperationalDataset& ds)
    -> Result<StepOutcome> {
  StepOutcome out;
  for (const auto& w : ds.workers) {
    auto inserted = store.insert_worker(w);
    if (!inserted) {
      log::error("Importing worker {} failed", w.id);
      return std::unexpected(inserted.error());
    }
    *inserted ? ++out.inserted : ++out.skipped;
  }
  log::info("Workers imported: {} new, {} already present", out.inserted,
            out.skipped);
  return out;
}

auto import_buildings(Store& store, const OperationalDataset& ds)
    -> Result<StepOutcome> {
  StepOutcome out;
  for (const auto& b : ds.buildings) {
    auto inserted = store.insert_building(b);
    if (!inserted) {
      log::error("Importing building {} failed", b.id);
      return std::unexpected(inserted.error());
    }
    *inserted ? ++out.inserted : ++out.skipped;
  }
  log::info("Buildings imported: {} new, {} already present", out.inserted,
            out.skipped);
  return out;
}

auto import_templates(Store& store, const OperationalDataset& ds)
    -> Result<StepOutcome> {
  StepOutcome out;
  for (const auto& t : ds.tasks) {
    auto resolved = references_resolve(store, t);
    if (!resolved)
      return std::unexpected(resolved.error());
    if (!*resolved) {
      log::warn("Skipping task '{}': worker {} or building {} not imported",
                t.title, t.worker_id, t.building_id);
      ++out.skipped;
      continue;
    }

    RoutineTemplate tpl;
    tpl.id = TemplateId{generate_uuid()};
    tpl.worker_id = t.worker_id;
    tpl.building_id = t.building_id;
    tpl.title = t.title;
    tpl.description = t.description;
    tpl.category = t.category;
    tpl.priority = derive_priority(t.title, t.category);
    tpl.recurrence = t.recurrence;
    tpl.days_of_week = t.days_of_week;
    tpl.start_hour = t.start_hour.value_or(0);
    tpl.end_hour = t.end_hour.value_or(23);
    tpl.estimated_duration_minutes = t.estimated_duration_minutes;
    tpl.requires_photo = t.requires_photo;

    // Unique on (worker, building, title): duplicates in the dataset and
    // rows from an earlier attempt both land here as "not inserted".
    auto inserted = store.insert_template(tpl);
    if (!inserted) {
      log::error("Importing template '{}' failed", t.title);
      return std::unexpected(inserted.error());
    }
    *inserted ? ++out.inserted : ++out.skipped;
  }
  log::info("Templates imported: {} new, {} skipped", out.inserted,
            out.skipped);
  return out;
}

auto create_assignments(Store& store, const OperationalDataset& ds)
    -> Result<StepOutcome> {
  std::set<std::pair<WorkerId, BuildingId>> pairs;
  for (const auto& t : ds.tasks) {
    pairs.emplace(t.worker_id, t.building_id);
  }

  StepOutcome out;
  for (const auto& [worker, building] : pairs) {
    auto w = store.worker_exists(worker);
    auto b = store.building_exists(building);
    if (!w)
      return std::unexpected(w.error());
    if (!b)
      return std::unexpected(b.error());
    if (!*w || !*b) {
      ++out.skipped;
      continue;
    }

    auto inserted = store.insert_assignment(worker, building, "maintenance");
    if (!inserted) {
      log::error("Assigning worker {} to building {} failed", worker, building);
      return std::unexpected(inserted.error());
    }
    *inserted ? ++out.inserted : ++out.skipped;
  }
  log::info("Worker assignments: {} new, {} skipped", out.inserted,
            out.skipped);
  return out;
}

auto setup_capabilities(Store& store, const OperationalDataset& ds)
    -> Result<StepOutcome> {
  StepOutcome out;
  for (const auto& caps : ds.capabilities) {
    auto exists = store.worker_exists(caps.worker_id);
    if (!exists)
      return std::unexpected(exists.error());
    if (!*exists) {
      log::warn("Skipping capabilities for unknown worker {}", caps.worker_id);
      ++out.skipped;
      continue;
    }
    if (auto r = store.upsert_capabilities(caps); !r) {
      log::error("Setting capabilities for worker {} failed", caps.worker_id);
      return std::unexpected(r.error());
    }
    ++out.inserted;
  }
  log::info("Capabilities configured for {} worker(s)", out.inserted);
  return out;
}

auto default_migration_steps() -> std::vector<MigrationStep> {
  return {
      {StepId{"import_workers"}, import_workers},
      {StepId{"import_buildings"}, import_buildings},
      {StepId{"import_templates"}, import_templates},
      {StepId{"create_assignments"}, create_assignments},
      {StepId{"setup_capabilities"}, setup_capabilities},
  };
}

}  // namespace dailyops

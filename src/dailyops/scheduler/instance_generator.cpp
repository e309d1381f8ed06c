#include "dailyops/scheduler/instance_generator.hpp"

#include "dailyops/app/services/event_service.hpp"
#include "dailyops/model/routine.hpp"
#include "dailyops/scheduler/recurrence.hpp"
#include "dailyops/storage/store.hpp"
#include "dailyops/util/log.hpp"

#include <set>

namespace dailyops {

InstanceGenerator::InstanceGenerator(Store& store, const Clock& clock)
    : store_(store), clock_(clock) {
}

auto InstanceGenerator::set_event_service(EventService* events) -> void {
  events_ = events;
}

auto InstanceGenerator::generate_for_date(CivilDate date)
    -> Result<GenerationReport> {
  auto templates = store_.fetch_active_templates();
  if (!templates) {
    log::error("Cannot fetch templates for {}: {}", date,
               templates.error().message());
    return fail(Error::DatabaseError);
  }

  GenerationReport report;
  std::set<BuildingId> touched;

  for (const auto& tpl : *templates) {
    if (!is_due(tpl, date)) {
      ++report.skipped_not_due;
      continue;
    }

    auto exists = store_.instance_exists(tpl.id, date);
    if (!exists) {
      log::warn("Lookup of instance {}@{} failed: {}", tpl.id, date,
                exists.error().message());
      ++report.failed;
      continue;
    }
    if (*exists) {
      ++report.skipped_existing;
      continue;
    }

    auto inst = make_instance(tpl, date, clock_.now());
    auto inserted = store_.insert_instance(inst);
    if (!inserted) {
      log::warn("Creating instance of '{}' for {} failed: {}", tpl.title, date,
                inserted.error().message());
      ++report.failed;
      continue;
    }
    // Lost a race with another writer on (template, date).
    if (!*inserted) {
      ++report.skipped_existing;
      continue;
    }

    log::debug("Created {} '{}' for worker {}", inst.id, inst.title,
               inst.worker_id);
    ++report.created;
    touched.insert(tpl.building_id);
  }

  log::info("Generation for {}: {} created, {} existing, {} not due, {} failed",
            date, report.created, report.skipped_existing,
            report.skipped_not_due, report.failed);

  if (events_) {
    events_->emit_instances_generated(date, report.created,
                                      report.skipped_existing,
                                      report.skipped_not_due, report.failed);
    for (const auto& building : touched) {
      events_->emit_metrics_invalidated(building, date);
    }
  }
  return report;
}

}  // namespace dailyops

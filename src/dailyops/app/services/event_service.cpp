#include "dailyops/app/services/event_service.hpp"

#include "dailyops/util/log.hpp"
#include "dailyops/util/util.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <utility>

namespace dailyops {

auto EventService::subscribe(Subscriber fn) -> SubscriptionId {
  std::lock_guard lock(mutex_);
  auto id = next_id_++;
  subscribers_.emplace_back(id, std::move(fn));
  return id;
}

auto EventService::unsubscribe(SubscriptionId id) -> void {
  std::lock_guard lock(mutex_);
  std::erase_if(subscribers_,
                [id](const auto& entry) { return entry.first == id; });
}

auto EventService::emit_migration_completed(int version,
                                            std::size_t steps_executed,
                                            std::string_view checksum)
    -> void {
  nlohmann::json j = {{"type", "migration_completed"},
                      {"schema_version", version},
                      {"steps_executed", steps_executed},
                      {"checksum", checksum}};
  publish("migration_completed", j.dump());
}

auto EventService::emit_instances_generated(CivilDate date,
                                            std::size_t created,
                                            std::size_t skipped_existing,
                                            std::size_t skipped_not_due,
                                            std::size_t failed) -> void {
  nlohmann::json j = {{"type", "instances_generated"},
                      {"date", date.str()},
                      {"created", created},
                      {"skipped_existing", skipped_existing},
                      {"skipped_not_due", skipped_not_due},
                      {"failed", failed}};
  publish("instances_generated", j.dump());
}

auto EventService::emit_metrics_invalidated(const BuildingId& building,
                                            CivilDate date) -> void {
  nlohmann::json j = {{"type", "metrics_invalidated"},
                      {"building_id", building.str()},
                      {"date", date.str()}};
  publish("metrics_invalidated", j.dump());
}

auto EventService::publish(std::string_view event, std::string data)
    -> void {
  EventMessage ev{format_timestamp(clock_->now()), std::string(event),
                  std::move(data)};
  std::vector<Subscriber> targets;
  {
    std::lock_guard lock(mutex_);
    targets.reserve(subscribers_.size());
    for (const auto& [_, fn] : subscribers_) {
      targets.push_back(fn);
    }
  }

  log::debug("Event {}: {}", ev.event, ev.data);
  for (const auto& fn : targets) {
    fn(ev);
  }
}

}  // namespace dailyops

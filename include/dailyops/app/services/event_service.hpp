#pragma once

#include "dailyops/core/calendar.hpp"
#include "dailyops/util/id.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dailyops {

struct EventMessage {
  std::string timestamp;
  std::string event;
  std::string data;  // JSON payload
};

// Fan-out of pipeline events to in-process subscribers (metrics cache,
// UI refresh, the CLI's verbose printer).
class EventService {
public:
  using Subscriber = std::function<void(const EventMessage&)>;
  using SubscriptionId = std::size_t;

  // Event timestamps are taken from clock.
  explicit EventService(const Clock& clock) : clock_(&clock) {}
  ~EventService() = default;

  EventService(const EventService&) = delete;
  auto operator=(const EventService&) -> EventService& = delete;

  auto subscribe(Subscriber fn) -> SubscriptionId;
  auto unsubscribe(SubscriptionId id) -> void;

  auto emit_migration_completed(int version, std::size_t steps_executed,
                                std::string_view checksum) -> void;
  auto emit_instances_generated(CivilDate date, std::size_t created,
                                std::size_t skipped_existing,
                                std::size_t skipped_not_due,
                                std::size_t failed) -> void;
  auto emit_metrics_invalidated(const BuildingId& building, CivilDate date)
      -> void;

private:
  auto publish(std::string_view event, std::string data) -> void;

  const Clock* clock_;
  std::mutex mutex_;
  std::vector<std::pair<SubscriptionId, Subscriber>> subscribers_;
  SubscriptionId next_id_{1};
};

}  // namespace dailyops

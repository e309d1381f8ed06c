#pragma once

#include "dailyops/core/calendar.hpp"
#include "dailyops/core/error.hpp"

#include <cstddef>

namespace dailyops {

class EventService;
class Store;

struct GenerationReport {
  std::size_t created{0};
  std::size_t skipped_existing{0};
  std::size_t skipped_not_due{0};
  std::size_t failed{0};
};

// Creates the missing pending instances of every active template due on a
// date. Safe to run any number of times for the same date.
class InstanceGenerator {
public:
  InstanceGenerator(Store& store, const Clock& clock);

  auto set_event_service(EventService* events) -> void;

  // A failure on one template is logged and counted; only failing to read
  // the templates fails the call (DatabaseError).
  [[nodiscard]] auto generate_for_date(CivilDate date)
      -> Result<GenerationReport>;

private:
  Store& store_;
  const Clock& clock_;
  EventService* events_{nullptr};
};

}  // namespace dailyops

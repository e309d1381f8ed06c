#pragma once

#include "dailyops/core/calendar.hpp"
#include "dailyops/core/error.hpp"

#include <cstddef>

namespace dailyops {

class Store;

struct CleanupReport {
  std::size_t deleted_instances{0};
  std::size_t deleted_sessions{0};
  std::size_t deleted_orphaned_attachments{0};
  std::size_t failed{0};
};

// Deletes history that has reached a terminal state and aged past the
// horizon: completed instances, closed work sessions, and attachments whose
// completion record is gone (those regardless of age). Pending instances
// are never touched.
class RetentionSweeper {
public:
  RetentionSweeper(Store& store, const Clock& clock);

  // horizon_days must be positive.
  [[nodiscard]] auto sweep(int horizon_days) -> Result<CleanupReport>;

private:
  Store& store_;
  const Clock& clock_;
};

}  // namespace dailyops

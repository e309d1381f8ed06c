#pragma once

#include "dailyops/core/error.hpp"
#include "dailyops/model/operational_dataset.hpp"
#include "dailyops/model/routine.hpp"
#include "dailyops/util/id.hpp"

#include <cstddef>
#include <functional>
#include <string_view>
#include <vector>

namespace dailyops {

class Store;

struct StepOutcome {
  std::size_t inserted{0};
  std::size_t skipped{0};
};

// Every action is insert-if-absent, so re-running a step whose completion
// marker was lost leaves the store unchanged.
using StepAction =
    std::function<Result<StepOutcome>(Store&, const OperationalDataset&)>;

struct MigrationStep {
  StepId id;
  StepAction action;
};

// Title and category decide how urgent a template is:
// "emergency" in the title -> urgent; "inspection" or "compliance" -> high;
// sanitation category -> high; anything else -> normal.
[[nodiscard]] auto derive_priority(std::string_view title,
                                   std::string_view category) -> TaskPriority;

[[nodiscard]] auto import_workers(Store& store, const OperationalDataset& ds)
    -> Result<StepOutcome>;
[[nodiscard]] auto import_buildings(Store& store, const OperationalDataset& ds)
    -> Result<StepOutcome>;
[[nodiscard]] auto import_templates(Store& store, const OperationalDataset& ds)
    -> Result<StepOutcome>;
[[nodiscard]] auto create_assignments(Store& store,
                                      const OperationalDataset& ds)
    -> Result<StepOutcome>;
[[nodiscard]] auto setup_capabilities(Store& store,
                                      const OperationalDataset& ds)
    -> Result<StepOutcome>;

// import_workers, import_buildings, import_templates, create_assignments,
// setup_capabilities; in that order.
[[nodiscard]] auto default_migration_steps() -> std::vector<MigrationStep>;

}  // namespace dailyops

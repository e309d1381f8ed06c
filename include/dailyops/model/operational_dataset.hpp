#pragma once

#include "dailyops/util/id.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dailyops {

struct WorkerRecord {
  WorkerId id;
  std::string name;
  std::string email;
  std::string role;
  std::string shift;
  bool active{true};
};

struct BuildingRecord {
  BuildingId id;
  std::string name;
  std::string address;
  std::string type;
  int floors{1};
  bool has_elevator{false};
  bool has_doorman{false};
  double latitude{0.0};
  double longitude{0.0};
};

// One row of the operational task matrix: who does what, where, how often.
struct TaskAssignment {
  WorkerId worker_id;
  BuildingId building_id;
  std::string title;
  std::string description;
  std::string category;
  std::string skill_level{"Basic"};
  std::string recurrence{"Daily"};
  std::optional<int> start_hour;
  std::optional<int> end_hour;
  std::optional<std::string> days_of_week;
  int estimated_duration_minutes{30};
  bool requires_photo{false};
};

struct WorkerCapabilityRecord {
  WorkerId worker_id;
  bool can_upload_photos{true};
  bool can_add_notes{true};
  bool can_view_map{true};
  bool can_add_emergency_tasks{false};
  bool requires_photo_for_sanitation{true};
  bool simplified_interface{false};
};

// The canonical source dataset that the one-time migration imports.
struct OperationalDataset {
  std::vector<WorkerRecord> workers;
  std::vector<BuildingRecord> buildings;
  std::vector<TaskAssignment> tasks;
  std::vector<WorkerCapabilityRecord> capabilities;
};

struct DatasetCounts {
  std::size_t workers{0};
  std::size_t buildings{0};
  std::size_t tasks{0};
  std::size_t capabilities{0};
};

[[nodiscard]] inline auto count(const OperationalDataset& ds) noexcept
    -> DatasetCounts {
  return {ds.workers.size(), ds.buildings.size(), ds.tasks.size(),
          ds.capabilities.size()};
}

// Content problems that would make an import lossy: unknown categories,
// skill levels or recurrences, bad hour ranges, dangling worker/building
// references, duplicate ids. Empty when the dataset is clean.
[[nodiscard]] auto validate_dataset(const OperationalDataset& ds)
    -> std::vector<std::string>;

}  // namespace dailyops

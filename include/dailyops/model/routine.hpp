#pragma once

#include "dailyops/core/calendar.hpp"
#include "dailyops/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace dailyops {

enum class TaskPriority : std::uint8_t {
  Low,
  Normal,
  High,
  Urgent,
};

enum class InstanceStatus : std::uint8_t {
  Pending,
  Completed,
};

// A recurring unit of work. Created by the template import step, never
// deleted; an administrative edit may flip `active`.
struct RoutineTemplate {
  TemplateId id;
  WorkerId worker_id;
  BuildingId building_id;
  std::string title;
  std::string description;
  std::string category;
  TaskPriority priority{TaskPriority::Normal};
  std::string recurrence{"daily"};
  // Comma list of day abbreviations; nullopt means "any day".
  std::optional<std::string> days_of_week;
  int start_hour{0};
  int end_hour{23};
  int estimated_duration_minutes{30};
  bool requires_photo{false};
  bool active{true};
};

// One dated occurrence of a template.
struct TaskInstance {
  InstanceId id;
  TemplateId template_id;
  WorkerId worker_id;
  BuildingId building_id;
  CivilDate scheduled_date;
  InstanceStatus status{InstanceStatus::Pending};
  std::string title;
  std::string description;
  std::string category;
  TaskPriority priority{TaskPriority::Normal};
  std::string recurrence;
  int estimated_duration_minutes{30};
  bool requires_photo{false};
  std::chrono::system_clock::time_point created_at{};
  std::chrono::system_clock::time_point updated_at{};
};

// Clock-in/clock-out period of a worker on site. Closed once ended_at is set.
struct WorkSession {
  SessionId id;
  WorkerId worker_id;
  BuildingId building_id;
  std::chrono::system_clock::time_point started_at{};
  std::optional<std::chrono::system_clock::time_point> ended_at;
};

struct TaskCompletion {
  CompletionId id;
  InstanceId instance_id;
  WorkerId worker_id;
  std::chrono::system_clock::time_point completed_at{};
};

// Photo evidence attached to a completion record.
struct Attachment {
  AttachmentId id;
  CompletionId completion_id;
  std::string path;
  std::chrono::system_clock::time_point created_at{};
};

// Copies the template fields an instance carries.
[[nodiscard]] auto make_instance(const RoutineTemplate& tpl, CivilDate date,
                                 std::chrono::system_clock::time_point now)
    -> TaskInstance;

}  // namespace dailyops

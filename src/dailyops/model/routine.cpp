#include "dailyops/model/routine.hpp"

namespace dailyops {

auto make_instance(const RoutineTemplate& tpl, CivilDate date,
                   std::chrono::system_clock::time_point now) -> TaskInstance {
  TaskInstance inst;
  inst.id = generate_instance_id(tpl.id, date.str());
  inst.template_id = tpl.id;
  inst.worker_id = tpl.worker_id;
  inst.building_id = tpl.building_id;
  inst.scheduled_date = date;
  inst.status = InstanceStatus::Pending;
  inst.title = tpl.title;
  inst.description = tpl.description;
  inst.category = tpl.category;
  inst.priority = tpl.priority;
  inst.recurrence = tpl.recurrence;
  inst.estimated_duration_minutes = tpl.estimated_duration_minutes;
  inst.requires_photo = tpl.requires_photo;
  inst.created_at = now;
  inst.updated_at = now;
  return inst;
}

}  // namespace dailyops

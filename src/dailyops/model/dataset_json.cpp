#include "dailyops/model/dataset_json.hpp"

namespace dailyops {

namespace {

template <typename T>
auto opt_to_json(const std::optional<T>& v) -> nlohmann::json {
  return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

template <typename T>
auto opt_from_json(const nlohmann::json& j, const char* key)
    -> std::optional<T> {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->template get<T>();
}

}  // namespace

void to_json(nlohmann::json& j, const WorkerRecord& w) {
  j = nlohmann::json{{"id", w.id.str()},   {"name", w.name},
                     {"email", w.email},   {"role", w.role},
                     {"shift", w.shift},   {"active", w.active}};
}

void from_json(const nlohmann::json& j, WorkerRecord& w) {
  w.id = WorkerId{j.at("id").get<std::string>()};
  w.name = j.at("name").get<std::string>();
  w.email = j.value("email", "");
  w.role = j.value("role", "");
  w.shift = j.value("shift", "");
  w.active = j.value("active", true);
}

void to_json(nlohmann::json& j, const BuildingRecord& b) {
  j = nlohmann::json{{"id", b.id.str()},
                     {"name", b.name},
                     {"address", b.address},
                     {"type", b.type},
                     {"floors", b.floors},
                     {"has_elevator", b.has_elevator},
                     {"has_doorman", b.has_doorman},
                     {"latitude", b.latitude},
                     {"longitude", b.longitude}};
}

void from_json(const nlohmann::json& j, BuildingRecord& b) {
  b.id = BuildingId{j.at("id").get<std::string>()};
  b.name = j.at("name").get<std::string>();
  b.address = j.value("address", "");
  b.type = j.value("type", "");
  b.floors = j.value("floors", 1);
  b.has_elevator = j.value("has_elevator", false);
  b.has_doorman = j.value("has_doorman", false);
  b.latitude = j.value("latitude", 0.0);
  b.longitude = j.value("longitude", 0.0);
}

void to_json(nlohmann::json& j, const TaskAssignment& t) {
  j = nlohmann::json{
      {"worker_id", t.worker_id.str()},
      {"building_id", t.building_id.str()},
      {"title", t.title},
      {"description", t.description},
      {"category", t.category},
      {"skill_level", t.skill_level},
      {"recurrence", t.recurrence},
      {"start_hour", opt_to_json(t.start_hour)},
      {"end_hour", opt_to_json(t.end_hour)},
      {"days_of_week", opt_to_json(t.days_of_week)},
      {"estimated_duration_minutes", t.estimated_duration_minutes},
      {"requires_photo", t.requires_photo}};
}

void from_json(const nlohmann::json& j, TaskAssignment& t) {
  t.worker_id = WorkerId{j.at("worker_id").get<std::string>()};
  t.building_id = BuildingId{j.at("building_id").get<std::string>()};
  t.title = j.at("title").get<std::string>();
  t.description = j.value("description", "");
  t.category = j.value("category", "");
  t.skill_level = j.value("skill_level", "Basic");
  t.recurrence = j.value("recurrence", "Daily");
  t.start_hour = opt_from_json<int>(j, "start_hour");
  t.end_hour = opt_from_json<int>(j, "end_hour");
  t.days_of_week = opt_from_json<std::string>(j, "days_of_week");
  t.estimated_duration_minutes = j.value("estimated_duration_minutes", 30);
  t.requires_photo = j.value("requires_photo", false);
}

void to_json(nlohmann::json& j, const WorkerCapabilityRecord& c) {
  j = nlohmann::json{
      {"worker_id", c.worker_id.str()},
      {"can_upload_photos", c.can_upload_photos},
      {"can_add_notes", c.can_add_notes},
      {"can_view_map", c.can_view_map},
      {"can_add_emergency_tasks", c.can_add_emergency_tasks},
      {"requires_photo_for_sanitation", c.requires_photo_for_sanitation},
      {"simplified_interface", c.simplified_interface}};
}

void from_json(const nlohmann::json& j, WorkerCapabilityRecord& c) {
  c.worker_id = WorkerId{j.at("worker_id").get<std::string>()};
  c.can_upload_photos = j.value("can_upload_photos", true);
  c.can_add_notes = j.value("can_add_notes", true);
  c.can_view_map = j.value("can_view_map", true);
  c.can_add_emergency_tasks = j.value("can_add_emergency_tasks", false);
  c.requires_photo_for_sanitation =
      j.value("requires_photo_for_sanitation", true);
  c.simplified_interface = j.value("simplified_interface", false);
}

void to_json(nlohmann::json& j, const OperationalDataset& ds) {
  j = nlohmann::json{{"workers", ds.workers},
                     {"buildings", ds.buildings},
                     {"tasks", ds.tasks},
                     {"capabilities", ds.capabilities}};
}

void from_json(const nlohmann::json& j, OperationalDataset& ds) {
  ds.workers = j.value("workers", std::vector<WorkerRecord>{});
  ds.buildings = j.value("buildings", std::vector<BuildingRecord>{});
  ds.tasks = j.value("tasks", std::vector<TaskAssignment>{});
  ds.capabilities =
      j.value("capabilities", std::vector<WorkerCapabilityRecord>{});
}

}  // namespace dailyops

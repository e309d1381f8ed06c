#include "dailyops/config/dataset_loader.hpp"

#include "dailyops/config/yaml_utils.hpp"
#include "dailyops/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<dailyops::WorkerRecord> {
  static bool decode(const Node& node, dailyops::WorkerRecord& w) {
    if (!node.IsMap() || !node["id"]) {
      return false;
    }
    w.id = node["id"].as<dailyops::WorkerId>();
    w.name = dailyops::yaml_get_or<std::string>(node, "name", "");
    w.email = dailyops::yaml_get_or<std::string>(node, "email", "");
    w.role = dailyops::yaml_get_or<std::string>(node, "role", "worker");
    w.shift = dailyops::yaml_get_or<std::string>(node, "shift", "");
    w.active = dailyops::yaml_get_or(node, "active", true);
    return true;
  }
};

template <>
struct convert<dailyops::BuildingRecord> {
  static bool decode(const Node& node, dailyops::BuildingRecord& b) {
    if (!node.IsMap() || !node["id"]) {
      return false;
    }
    b.id = node["id"].as<dailyops::BuildingId>();
    b.name = dailyops::yaml_get_or<std::string>(node, "name", "");
    b.address = dailyops::yaml_get_or<std::string>(node, "address", "");
    b.type = dailyops::yaml_get_or<std::string>(node, "type", "residential");
    b.floors = dailyops::yaml_get_or(node, "floors", 1);
    b.has_elevator = dailyops::yaml_get_or(node, "has_elevator", false);
    b.has_doorman = dailyops::yaml_get_or(node, "has_doorman", false);
    b.latitude = dailyops::yaml_get_or(node, "latitude", 0.0);
    b.longitude = dailyops::yaml_get_or(node, "longitude", 0.0);
    return true;
  }
};

template <>
struct convert<dailyops::TaskAssignment> {
  static bool decode(const Node& node, dailyops::TaskAssignment& t) {
    if (!node.IsMap() || !node["worker_id"] || !node["building_id"]) {
      return false;
    }
    t.worker_id = node["worker_id"].as<dailyops::WorkerId>();
    t.building_id = node["building_id"].as<dailyops::BuildingId>();
    t.title = dailyops::yaml_get_or<std::string>(node, "title", "");
    t.description = dailyops::yaml_get_or<std::string>(node, "description", "");
    t.category = dailyops::yaml_get_or<std::string>(node, "category", "");
    t.skill_level = dailyops::yaml_get_or<std::string>(node, "skill_level", "Basic");
    t.recurrence = dailyops::yaml_get_or<std::string>(node, "recurrence", "Daily");
    t.start_hour = dailyops::yaml_get_opt<int>(node, "start_hour");
    t.end_hour = dailyops::yaml_get_opt<int>(node, "end_hour");
    t.days_of_week = dailyops::yaml_get_opt<std::string>(node, "days_of_week");
    t.estimated_duration_minutes =
        dailyops::yaml_get_or(node, "estimated_duration_minutes", 30);
    t.requires_photo = dailyops::yaml_get_or(node, "requires_photo", false);
    return true;
  }
};

template <>
struct convert<dailyops::WorkerCapabilityRecord> {
  static bool decode(const Node& node, dailyops::WorkerCapabilityRecord& c) {
    if (!node.IsMap() || !node["worker_id"]) {
      return false;
    }
    c.worker_id = node["worker_id"].as<dailyops::WorkerId>();
    c.can_upload_photos = dailyops::yaml_get_or(node, "can_upload_photos", true);
    c.can_add_notes = dailyops::yaml_get_or(node, "can_add_notes", true);
    c.can_view_map = dailyops::yaml_get_or(node, "can_view_map", true);
    c.can_add_emergency_tasks =
        dailyops::yaml_get_or(node, "can_add_emergency_tasks", false);
    c.requires_photo_for_sanitation =
        dailyops::yaml_get_or(node, "requires_photo_for_sanitation", true);
    c.simplified_interface =
        dailyops::yaml_get_or(node, "simplified_interface", false);
    return true;
  }
};

template <>
struct convert<dailyops::OperationalDataset> {
  static bool decode(const Node& node, dailyops::OperationalDataset& ds) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto v = node["workers"]) {
      ds.workers = v.as<std::vector<dailyops::WorkerRecord>>();
    }
    if (auto v = node["buildings"]) {
      ds.buildings = v.as<std::vector<dailyops::BuildingRecord>>();
    }
    if (auto v = node["tasks"]) {
      ds.tasks = v.as<std::vector<dailyops::TaskAssignment>>();
    }
    if (auto v = node["capabilities"]) {
      ds.capabilities = v.as<std::vector<dailyops::WorkerCapabilityRecord>>();
    }
    return true;
  }
};

}  // namespace YAML

namespace dailyops {

auto DatasetLoader::load_from_file(std::string_view path)
    -> Result<OperationalDataset> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open dataset file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto DatasetLoader::load_from_string(std::string_view yaml_str)
    -> Result<OperationalDataset> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse dataset: empty or invalid content");
      return fail(Error::ParseError);
    }
    auto ds = root.as<OperationalDataset>();
    log::debug("Dataset parsed: {} workers, {} buildings, {} tasks",
               ds.workers.size(), ds.buildings.size(), ds.tasks.size());
    return ok(std::move(ds));
  } catch (const YAML::Exception& e) {
    log::error("Dataset YAML error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace dailyops

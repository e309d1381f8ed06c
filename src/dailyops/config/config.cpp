#include "dailyops/config/config.hpp"

#include "dailyops/config/yaml_utils.hpp"
#include "dailyops/core/calendar.hpp"
#include "dailyops/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<dailyops::StorageConfig> {
  static bool decode(const Node& node, dailyops::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file = dailyops::yaml_get_or<std::string>(node, "db_file", "dailyops.db");
    return true;
  }
};

template <>
struct convert<dailyops::SchedulerConfig> {
  static bool decode(const Node& node, dailyops::SchedulerConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.log_level = dailyops::yaml_get_or<std::string>(node, "log_level", "info");
    s.log_file = dailyops::yaml_get_or<std::string>(node, "log_file", "");
    s.fire_time = dailyops::yaml_get_or<std::string>(node, "fire_time", "00:01");
    s.retention_days = dailyops::yaml_get_or(node, "retention_days", 90);
    return true;
  }
};

template <>
struct convert<dailyops::MigrationConfig> {
  static bool decode(const Node& node, dailyops::MigrationConfig& m) {
    if (!node.IsMap()) {
      return false;
    }
    m.target_version = dailyops::yaml_get_or(node, "target_version", 1);
    m.dataset_file = dailyops::yaml_get_or<std::string>(
        node, "dataset_file", "data/operational_dataset.yaml");
    m.backup_dir = dailyops::yaml_get_or<std::string>(node, "backup_dir", "backups");
    m.expected_checksum =
        dailyops::yaml_get_or<std::string>(node, "expected_checksum", "");
    return true;
  }
};

template <>
struct convert<dailyops::SystemConfig> {
  static bool decode(const Node& node, dailyops::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<dailyops::StorageConfig>();
    }
    if (auto scheduler = node["scheduler"]) {
      c.scheduler = scheduler.as<dailyops::SchedulerConfig>();
    }
    if (auto migration = node["migration"]) {
      c.migration = migration.as<dailyops::MigrationConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace dailyops {

namespace {

auto check(const SystemConfig& c) -> Result<void> {
  if (auto t = TimeOfDay::parse(c.scheduler.fire_time); !t) {
    log::error("Invalid scheduler.fire_time '{}'", c.scheduler.fire_time);
    return fail(t.error());
  }
  if (c.scheduler.retention_days <= 0) {
    log::error("scheduler.retention_days must be positive, got {}",
               c.scheduler.retention_days);
    return fail(Error::InvalidArgument);
  }
  if (c.migration.target_version <= 0) {
    log::error("migration.target_version must be positive, got {}",
               c.migration.target_version);
    return fail(Error::InvalidArgument);
  }
  return ok();
}

void to_yaml(YAML::Emitter& out, const StorageConfig& s) {
  out << YAML::BeginMap;
  if (s.db_file != "dailyops.db") {
    yaml_emit(out, "db_file", s.db_file);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const SchedulerConfig& s) {
  out << YAML::BeginMap;
  yaml_emit(out, "log_level", s.log_level);
  yaml_emit_if_not_empty(out, "log_file", s.log_file);
  if (s.fire_time != "00:01") {
    yaml_emit(out, "fire_time", s.fire_time);
  }
  if (s.retention_days != 90) {
    yaml_emit(out, "retention_days", s.retention_days);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const MigrationConfig& m) {
  out << YAML::BeginMap;
  if (m.target_version != 1) {
    yaml_emit(out, "target_version", m.target_version);
  }
  if (m.dataset_file != "data/operational_dataset.yaml") {
    yaml_emit(out, "dataset_file", m.dataset_file);
  }
  if (m.backup_dir != "backups") {
    yaml_emit(out, "backup_dir", m.backup_dir);
  }
  yaml_emit_if_not_empty(out, "expected_checksum", m.expected_checksum);
  out << YAML::EndMap;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  SystemConfig config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    config = root.as<SystemConfig>();
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }

  if (auto r = check(config); !r) {
    return fail(r.error());
  }
  return ok(std::move(config));
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "storage" << YAML::Value;
  to_yaml(out, config.storage);
  out << YAML::Key << "scheduler" << YAML::Value;
  to_yaml(out, config.scheduler);
  out << YAML::Key << "migration" << YAML::Value;
  to_yaml(out, config.migration);
  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace dailyops

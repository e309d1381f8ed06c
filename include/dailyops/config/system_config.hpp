#pragma once

#include <string>

namespace dailyops {

struct StorageConfig {
  std::string db_file{"dailyops.db"};
};

struct SchedulerConfig {
  std::string log_level{"info"};
  std::string log_file;
  std::string fire_time{"00:01"};
  int retention_days{90};
};

struct MigrationConfig {
  int target_version{1};
  std::string dataset_file{"data/operational_dataset.yaml"};
  std::string backup_dir{"backups"};
  // Known-good dataset checksum; empty means "trust the first backup".
  std::string expected_checksum;
};

struct SystemConfig {
  StorageConfig storage;
  SchedulerConfig scheduler;
  MigrationConfig migration;
};

}  // namespace dailyops

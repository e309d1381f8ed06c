#pragma once

#include "dailyops/core/calendar.hpp"
#include "dailyops/core/error.hpp"
#include "dailyops/model/operational_dataset.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace dailyops {

inline constexpr int kBackupFormatVersion = 1;

struct BackupRecord {
  std::filesystem::path path;
  std::string checksum;
  int format_version{kBackupFormatVersion};
  int target_version{0};
  std::chrono::system_clock::time_point created_at{};
  DatasetCounts counts;
};

struct LoadedBackup {
  BackupRecord record;
  OperationalDataset dataset;
};

// Writes immutable dataset snapshots into one directory. Each call produces
// a new file, operational_backup_<YYYYMMDDTHHMMSSZ>_<8 hex>.json; existing
// files are never overwritten.
class BackupService {
public:
  BackupService(std::filesystem::path directory, const Clock& clock);

  [[nodiscard]] auto create_backup(const OperationalDataset& ds,
                                   int target_version) -> Result<BackupRecord>;

  // Re-reads a snapshot and verifies its checksum against its content.
  [[nodiscard]] static auto load_backup(const std::filesystem::path& path)
      -> Result<LoadedBackup>;

  [[nodiscard]] auto directory() const noexcept
      -> const std::filesystem::path& {
    return directory_;
  }

private:
  std::filesystem::path directory_;
  const Clock& clock_;
};

}  // namespace dailyops

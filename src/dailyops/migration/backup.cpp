#include "dailyops/migration/backup.hpp"

#include "dailyops/migration/checksum.hpp"
#include "dailyops/model/dataset_json.hpp"
#include "dailyops/util/id.hpp"
#include "dailyops/util/log.hpp"
#include "dailyops/util/util.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace dailyops {

namespace {

constexpr int kMaxNameAttempts = 8;

// Creates `path` exclusively and writes `content` durably. EEXIST is
// reported as AlreadyExists so the caller can pick another name.
auto write_exclusive(const std::filesystem::path& path,
                     std::string_view content) -> Result<void> {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) {
    if (errno == EEXIST) {
      return fail(Error::AlreadyExists);
    }
    log::error("Cannot create backup {}: {}", path.string(),
               std::strerror(errno));
    return fail(Error::BackupFailed);
  }

  const char* p = content.data();
  std::size_t left = content.size();
  while (left > 0) {
    auto n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      log::error("Write to backup {} failed: {}", path.string(),
                 std::strerror(errno));
      ::close(fd);
      std::error_code ec;
      std::filesystem::remove(path, ec);
      return fail(Error::BackupFailed);
    }
    p += n;
    left -= static_cast<std::size_t>(n);
  }

  bool synced = ::fsync(fd) == 0;
  if (::close(fd) != 0 || !synced) {
    log::error("Flushing backup {} failed: {}", path.string(),
               std::strerror(errno));
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return fail(Error::BackupFailed);
  }
  return ok();
}

}  // namespace

BackupService::BackupService(std::filesystem::path directory,
                             const Clock& clock)
    : directory_(std::move(directory)), clock_(clock) {
}

auto BackupService::create_backup(const OperationalDataset& ds,
                                  int target_version) -> Result<BackupRecord> {
  auto checksum = compute_checksum(ds);
  if (!checksum) {
    return fail(Error::BackupFailed);
  }

  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    log::error("Cannot create backup directory {}: {}", directory_.string(),
               ec.message());
    return fail(Error::BackupFailed);
  }

  BackupRecord record;
  record.checksum = std::move(*checksum);
  record.target_version = target_version;
  record.created_at = clock_.now();
  record.counts = count(ds);

  nlohmann::json j = {
      {"format_version", record.format_version},
      {"target_version", record.target_version},
      {"created_at", format_timestamp(record.created_at)},
      {"created_at_ms", to_timestamp(record.created_at)},
      {"checksum", record.checksum},
      {"counts",
       {{"workers", record.counts.workers},
        {"buildings", record.counts.buildings},
        {"tasks", record.counts.tasks},
        {"capabilities", record.counts.capabilities}}},
      {"dataset", ds},
  };

  std::string content;
  try {
    content = j.dump(2);
  } catch (const nlohmann::json::exception& e) {
    log::error("Backup serialization failed: {}", e.what());
    return fail(Error::BackupFailed);
  }

  auto stamp = format_compact_timestamp(record.created_at);
  for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
    auto path = directory_ / std::format("operational_backup_{}_{}.json", stamp,
                                         detail::generate_short_uuid());
    auto r = write_exclusive(path, content);
    if (r) {
      record.path = std::move(path);
      log::info("Backup written: {} ({} workers, {} buildings, {} tasks)",
                record.path.string(), record.counts.workers,
                record.counts.buildings, record.counts.tasks);
      return record;
    }
    if (r.error() != make_error_code(Error::AlreadyExists)) {
      return fail(r.error());
    }
    log::debug("Backup name collision on {}, retrying", path.string());
  }

  log::error("Could not find a free backup name in {}", directory_.string());
  return fail(Error::BackupFailed);
}

auto BackupService::load_backup(const std::filesystem::path& path)
    -> Result<LoadedBackup> {
  std::ifstream file(path);
  if (!file.is_open()) {
    log::error("Failed to open backup: {}", path.string());
    return fail(Error::FileNotFound);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  LoadedBackup loaded;
  try {
    auto j = nlohmann::json::parse(buffer.str());
    loaded.record.path = path;
    loaded.record.format_version = j.at("format_version").get<int>();
    loaded.record.target_version = j.value("target_version", 0);
    loaded.record.created_at =
        from_timestamp(j.value("created_at_ms", std::int64_t{0}));
    loaded.record.checksum = j.at("checksum").get<std::string>();
    loaded.dataset = j.at("dataset").get<OperationalDataset>();
    loaded.record.counts = count(loaded.dataset);
  } catch (const nlohmann::json::exception& e) {
    log::error("Backup {} is unreadable: {}", path.string(), e.what());
    return fail(Error::ParseError);
  }

  auto actual = compute_checksum(loaded.dataset);
  if (!actual) {
    return fail(actual.error());
  }
  if (*actual != loaded.record.checksum) {
    log::error("Backup {} checksum mismatch: recorded {}, content {}",
               path.string(), loaded.record.checksum, *actual);
    return fail(Error::IntegrityCheckFailed);
  }
  return loaded;
}

}  // namespace dailyops

#include "dailyops/migration/orchestrator.hpp"

#include "dailyops/app/services/event_service.hpp"
#include "dailyops/migration/checksum.hpp"
#include "dailyops/storage/store.hpp"
#include "dailyops/util/log.hpp"

#include <charconv>
#include <filesystem>
#include <ranges>

namespace dailyops {

namespace {

constexpr std::string_view kStepSavepoint = "migration_step";

auto parse_int(const std::string& s) -> std::optional<int> {
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size())
    return std::nullopt;
  return value;
}

}  // namespace

MigrationOrchestrator::MigrationOrchestrator(Store& store, const Clock& clock,
                                             MigrationConfig config,
                                             DatasetSource source,
                                             std::vector<MigrationStep> steps)
    : store_(store),
      clock_(clock),
      config_(std::move(config)),
      source_(std::move(source)),
      steps_(std::move(steps)),
      backups_(config_.backup_dir, clock) {
}

auto MigrationOrchestrator::set_event_service(EventService* events) -> void {
  events_ = events;
}

auto MigrationOrchestrator::last_failed_step() const -> std::optional<StepId> {
  std::lock_guard lock(state_mutex_);
  return last_failed_step_;
}

auto MigrationOrchestrator::run_if_needed() -> Result<MigrationReport> {
  std::unique_lock run_lock(run_mutex_, std::try_to_lock);
  if (!run_lock.owns_lock()) {
    log::warn("Migration already in progress");
    return fail(Error::Busy);
  }

  auto version = store_.schema_version();
  if (!version) {
    return fail(version.error());
  }

  MigrationReport report;
  report.from_version = *version;
  report.to_version = *version;
  if (*version >= config_.target_version) {
    log::debug("Schema version {} is current (target {})", *version,
               config_.target_version);
    return report;
  }

  log::info("Schema version {} below target {}, migrating", *version,
            config_.target_version);

  auto dataset = source_();
  if (!dataset) {
    log::error("Cannot load operational dataset: {}",
               dataset.error().message());
    return fail(dataset.error());
  }

  auto checksum = compute_checksum(*dataset);
  if (!checksum) {
    return fail(checksum.error());
  }
  report.checksum = *checksum;

  auto expected = known_good_checksum();
  if (!expected) {
    return fail(expected.error());
  }
  if (*expected && **expected != *checksum) {
    log::error("Dataset checksum {} does not match known-good {}", *checksum,
               **expected);
    return fail(Error::IntegrityCheckFailed);
  }

  if (auto r = ensure_backup(*dataset, *checksum, report); !r) {
    return fail(r.error());
  }

  if (auto r = run_steps(*dataset, report); !r) {
    return fail(r.error());
  }

  {
    std::lock_guard lock(state_mutex_);
    last_failed_step_.reset();
  }
  report.ran = true;
  report.to_version = config_.target_version;
  log::info("Migration complete: schema version {} -> {} ({} step(s) run, {} "
            "already done)",
            report.from_version, report.to_version, report.executed.size(),
            report.skipped.size());

  if (events_) {
    events_->emit_migration_completed(report.to_version,
                                      report.executed.size(), report.checksum);
  }
  return report;
}

auto MigrationOrchestrator::known_good_checksum()
    -> Result<std::optional<std::string>> {
  if (!config_.expected_checksum.empty()) {
    return std::optional<std::string>{config_.expected_checksum};
  }

  auto recorded_version = store_.get_setting(kLastBackupVersionKey);
  if (!recorded_version)
    return std::unexpected(recorded_version.error());
  if (!*recorded_version ||
      parse_int(**recorded_version) != config_.target_version) {
    return std::optional<std::string>{};
  }
  return store_.get_setting(kLastBackupChecksumKey);
}

auto MigrationOrchestrator::ensure_backup(const OperationalDataset& ds,
                                          const std::string& checksum,
                                          MigrationReport& report)
    -> Result<void> {
  auto path = store_.get_setting(kLastBackupPathKey);
  auto sum = store_.get_setting(kLastBackupChecksumKey);
  auto ver = store_.get_setting(kLastBackupVersionKey);
  if (!path)
    return fail(path.error());
  if (!sum)
    return fail(sum.error());
  if (!ver)
    return fail(ver.error());

  // A retry of an unfinished attempt keeps the first attempt's backup.
  if (*path && *sum && *ver && **sum == checksum &&
      parse_int(**ver) == config_.target_version) {
    std::error_code ec;
    if (std::filesystem::exists(**path, ec)) {
      log::info("Reusing backup {}", **path);
      report.backup_path = **path;
      report.backup_reused = true;
      return ok();
    }
    log::warn("Recorded backup {} is missing, taking a new one", **path);
  }

  auto record = backups_.create_backup(ds, config_.target_version);
  if (!record) {
    log::error("Backup failed, migration aborted before any step ran");
    return fail(Error::BackupFailed);
  }

  auto path_str = record->path.string();
  if (auto r = store_.set_setting(kLastBackupPathKey, path_str); !r)
    return r;
  if (auto r = store_.set_setting(kLastBackupChecksumKey, record->checksum); !r)
    return r;
  if (auto r = store_.set_setting(kLastBackupVersionKey,
                                  std::to_string(config_.target_version));
      !r)
    return r;

  report.backup_path = std::move(path_str);
  return ok();
}

auto MigrationOrchestrator::abort_transaction() -> void {
  if (auto r = store_.rollback(); !r) {
    log::error("Rollback failed: {}", r.error().message());
  }
}

auto MigrationOrchestrator::run_steps(const OperationalDataset& ds,
                                      MigrationReport& report)
    -> Result<void> {
  const int target = config_.target_version;

  if (auto r = store_.begin_exclusive(); !r) {
    log::error("Cannot start migration transaction: {}", r.error().message());
    return r;
  }

  for (const auto& [idx, step] : steps_ | std::views::enumerate) {
    const int position = static_cast<int>(idx) + 1;

    auto done = store_.is_step_completed(target, step.id);
    if (!done) {
      abort_transaction();
      return fail(done.error());
    }
    if (*done) {
      log::debug("Step {} already completed, skipping", step.id);
      report.skipped.push_back(step.id);
      continue;
    }

    if (auto r = store_.savepoint(kStepSavepoint); !r) {
      abort_transaction();
      return r;
    }

    log::info("Running migration step {} ({}/{})", step.id, position,
              steps_.size());
    auto outcome = step.action(store_, ds);
    Result<void> marked = outcome ? store_.record_step(target, step.id,
                                                       position, clock_.now())
                                  : Result<void>{fail(outcome.error())};
    if (!marked) {
      log::error("Migration step {} failed: {}", step.id,
                 marked.error().message());
      {
        std::lock_guard lock(state_mutex_);
        last_failed_step_ = step.id;
      }

      // Keep the steps that already succeeded; the next attempt resumes here.
      if (auto r = store_.rollback_to_savepoint(kStepSavepoint); !r) {
        abort_transaction();
        return fail(Error::StepExecutionFailed);
      }
      if (auto r = store_.commit(); !r) {
        log::error("Committing completed steps failed: {}",
                   r.error().message());
        abort_transaction();
      }
      return fail(Error::StepExecutionFailed);
    }

    if (auto r = store_.release_savepoint(kStepSavepoint); !r) {
      abort_transaction();
      return r;
    }
    log::info("Step {} done: {} inserted, {} skipped", step.id,
              outcome->inserted, outcome->skipped);
    report.executed.push_back(step.id);
  }

  if (auto r = store_.advance_schema_version(target); !r) {
    abort_transaction();
    return r;
  }
  if (auto r = store_.commit(); !r) {
    abort_transaction();
    return r;
  }
  return ok();
}

}  // namespace dailyops

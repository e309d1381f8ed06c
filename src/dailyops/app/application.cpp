#include "dailyops/app/application.hpp"

#include "dailyops/app/services/event_service.hpp"
#include "dailyops/config/dataset_loader.hpp"
#include "dailyops/storage/sqlite_store.hpp"
#include "dailyops/util/log.hpp"

namespace dailyops {

Application::Application(Config config)
    : config_(std::move(config)),
      owned_clock_(std::make_unique<SystemClock>()),
      clock_(owned_clock_.get()) {
  init_services();
}

Application::Application(Config config, const Clock& clock)
    : config_(std::move(config)), clock_(&clock) {
  init_services();
}

auto Application::init_services() -> void {
  store_ = std::make_unique<SqliteStore>(config_.storage.db_file);
  events_ = std::make_unique<EventService>(*clock_);

  orchestrator_ = std::make_unique<MigrationOrchestrator>(
      *store_, *clock_, config_.migration,
      [this] { return load_dataset(); });
  orchestrator_->set_event_service(events_.get());

  generator_ = std::make_unique<InstanceGenerator>(*store_, *clock_);
  generator_->set_event_service(events_.get());

  sweeper_ = std::make_unique<RetentionSweeper>(*store_, *clock_);

  pipeline_ = std::make_unique<DailyPipeline>(*orchestrator_, *generator_,
                                              *sweeper_,
                                              config_.scheduler.retention_days);

  // fire_time was validated by ConfigLoader; fall back to 00:01 for configs
  // built in code.
  auto fire_time = TimeOfDay::parse(config_.scheduler.fire_time)
                       .value_or(TimeOfDay{0, 1});
  trigger_ = std::make_unique<DailyTrigger>(
      *store_, *clock_, fire_time, [this](CivilDate date) -> Result<void> {
        auto r = pipeline_->run(date);
        if (!r)
          return fail(r.error());
        return ok();
      });
}

Application::~Application() {
  stop();
}

auto Application::open() -> Result<void> {
  return store_->open();
}

auto Application::start() -> void {
  trigger_->start();
}

auto Application::stop() -> void {
  if (trigger_) {
    trigger_->stop();
  }
}

auto Application::is_running() const noexcept -> bool {
  return trigger_ && trigger_->is_running();
}

auto Application::on_resume() -> FireOutcome {
  return trigger_->on_resume();
}

auto Application::run_daily(bool force) -> FireOutcome {
  return trigger_->fire(FireSource::Manual, force);
}

auto Application::migrate() -> Result<MigrationReport> {
  return pipeline_->migrate(clock_->today());
}

auto Application::generate(CivilDate date) -> Result<GenerationReport> {
  return generator_->generate_for_date(date);
}

auto Application::sweep(std::optional<int> horizon_days)
    -> Result<CleanupReport> {
  return sweeper_->sweep(horizon_days.value_or(config_.scheduler.retention_days));
}

auto Application::status() -> Result<StatusReport> {
  StatusReport report;
  report.target_version = config_.migration.target_version;
  report.total_steps = orchestrator_->steps().size();

  auto version = store_->schema_version();
  if (!version)
    return fail(version.error());
  report.schema_version = *version;

  auto steps = store_->completed_steps(report.target_version);
  if (!steps)
    return fail(steps.error());
  report.completed_steps = std::move(*steps);

  auto last_run = store_->last_run_date();
  if (!last_run)
    return fail(last_run.error());
  report.last_run_date = *last_run;

  auto path = store_->get_setting(kLastBackupPathKey);
  if (!path)
    return fail(path.error());
  report.last_backup_path = std::move(*path);

  auto sum = store_->get_setting(kLastBackupChecksumKey);
  if (!sum)
    return fail(sum.error());
  report.last_backup_checksum = std::move(*sum);

  auto counts = store_->counts();
  if (!counts)
    return fail(counts.error());
  report.counts = *counts;
  return report;
}

auto Application::load_dataset() const -> Result<OperationalDataset> {
  auto ds = DatasetLoader::load_from_file(config_.migration.dataset_file);
  if (!ds)
    return ds;
  for (const auto& problem : validate_dataset(*ds)) {
    log::warn("Dataset: {}", problem);
  }
  return ds;
}

auto Application::config() const noexcept -> const Config& {
  return config_;
}

auto Application::clock() const noexcept -> const Clock& {
  return *clock_;
}

auto Application::store() -> Store& {
  return *store_;
}

auto Application::events() -> EventService& {
  return *events_;
}

auto Application::trigger() -> DailyTrigger& {
  return *trigger_;
}

auto Application::orchestrator() -> MigrationOrchestrator& {
  return *orchestrator_;
}

auto Application::pipeline() -> DailyPipeline& {
  return *pipeline_;
}

}  // namespace dailyops

#include "dailyops/scheduler/daily_trigger.hpp"

#include "dailyops/storage/store.hpp"
#include "dailyops/util/log.hpp"
#include "dailyops/util/util.hpp"

#include <sys/eventfd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

#include <poll.h>
#include <unistd.h>

namespace dailyops {

namespace {

constexpr std::array<std::string_view, 3> kTriggerStateNames = {
    "idle", "running", "failed"};
constexpr std::array<std::string_view, 3> kFireSourceNames = {
    "timer", "resume", "manual"};
constexpr std::array<std::string_view, 4> kFireOutcomeNames = {
    "completed", "already_ran", "busy", "failed"};

// Upper bound on one sleep so wall-clock jumps are noticed.
constexpr auto kMaxSleep = std::chrono::minutes{1};

// Clears the in-progress flag on every exit path of fire().
class InProgressGuard {
public:
  explicit InProgressGuard(std::atomic<bool>& flag) noexcept : flag_(flag) {}
  ~InProgressGuard() { flag_.store(false, std::memory_order_release); }

  InProgressGuard(const InProgressGuard&) = delete;
  auto operator=(const InProgressGuard&) -> InProgressGuard& = delete;

private:
  std::atomic<bool>& flag_;
};

}  // namespace

auto trigger_state_name(TriggerState s) noexcept -> std::string_view {
  auto idx = std::to_underlying(s);
  return idx < kTriggerStateNames.size() ? kTriggerStateNames[idx] : "idle";
}

auto fire_source_name(FireSource s) noexcept -> std::string_view {
  auto idx = std::to_underlying(s);
  return idx < kFireSourceNames.size() ? kFireSourceNames[idx] : "manual";
}

auto fire_outcome_name(FireOutcome o) noexcept -> std::string_view {
  auto idx = std::to_underlying(o);
  return idx < kFireOutcomeNames.size() ? kFireOutcomeNames[idx] : "failed";
}

DailyTrigger::DailyTrigger(Store& store, const Clock& clock,
                           TimeOfDay fire_time, Job job)
    : store_(store), clock_(clock), fire_time_(fire_time), job_(std::move(job)) {
  event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (event_fd_ < 0) {
    log::error("Failed to create eventfd: {}", std::strerror(errno));
  }
}

DailyTrigger::~DailyTrigger() {
  stop();
  if (event_fd_ >= 0) {
    ::close(event_fd_);
    event_fd_ = -1;
  }
}

auto DailyTrigger::start() -> void {
  if (running_.exchange(true))
    return;

  loop_thread_ = std::thread([this] { run_loop(); });
  log::info("Daily trigger started, next run at {}",
            format_timestamp(next_fire_time()));
}

auto DailyTrigger::stop() -> void {
  if (!running_.exchange(false))
    return;
  wake();
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
  log::info("Daily trigger stopped");
}

auto DailyTrigger::wake() -> void {
  std::uint64_t val = 1;
  if (event_fd_ >= 0 && ::write(event_fd_, &val, sizeof(val)) < 0) {
    log::warn("Failed to write to event_fd: {}", std::strerror(errno));
  }
}

auto DailyTrigger::on_resume() -> FireOutcome {
  log::info("Resume detected, checking for a missed daily run");
  return fire(FireSource::Resume);
}

auto DailyTrigger::fire(FireSource source, bool force) -> FireOutcome {
  bool expected = false;
  if (!in_progress_.compare_exchange_strong(expected, true,
                                            std::memory_order_acq_rel)) {
    log::debug("Daily run already in progress, ignoring {} fire",
               fire_source_name(source));
    return FireOutcome::Busy;
  }
  InProgressGuard guard(in_progress_);

  auto today = clock_.today();
  if (!force) {
    auto last = store_.last_run_date();
    if (!last) {
      log::error("Cannot read run marker: {}", last.error().message());
      state_.store(TriggerState::Failed);
      return FireOutcome::Failed;
    }
    if (*last && **last == today) {
      log::debug("Daily run for {} already done ({} fire)", today,
                 fire_source_name(source));
      return FireOutcome::AlreadyRan;
    }
  }

  log::info("Daily run for {} starting ({} fire)", today,
            fire_source_name(source));
  state_.store(TriggerState::Running);

  if (auto r = job_(today); !r) {
    log::error("Daily run for {} failed: {}", today, r.error().message());
    state_.store(TriggerState::Failed);
    return FireOutcome::Failed;
  }

  if (auto r = store_.set_last_run_date(today); !r) {
    log::error("Daily run for {} finished but the run marker was not saved: {}",
               today, r.error().message());
    state_.store(TriggerState::Failed);
    return FireOutcome::Failed;
  }

  state_.store(TriggerState::Idle);
  log::info("Daily run for {} completed", today);
  return FireOutcome::Completed;
}

auto DailyTrigger::run_loop() -> void {
  pollfd pfd{event_fd_, POLLIN, 0};
  auto next = next_fire_time();

  while (running_.load(std::memory_order_relaxed)) {
    auto now = clock_.now();
    if (now >= next) {
      fire(FireSource::Timer);
      next = next_fire_time();
      continue;
    }

    auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::min<Clock::TimePoint::duration>(next - now, kMaxSleep));
    int timeout_ms = std::max(0, static_cast<int>(delay.count()));

    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0 && errno != EINTR) {
      log::error("poll failed: {}", std::strerror(errno));
      break;
    }

    // Drain eventfd
    std::uint64_t val;
    while (::read(event_fd_, &val, sizeof(val)) > 0) {
    }
  }
}

}  // namespace dailyops

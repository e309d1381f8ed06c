#pragma once

#include "dailyops/core/calendar.hpp"
#include "dailyops/core/error.hpp"
#include "dailyops/core/lockfree_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>
#include <thread>

namespace dailyops {

class Store;

enum class TriggerState : std::uint8_t {
  Idle,
  Running,
  Failed,
};

enum class FireSource : std::uint8_t {
  Timer,
  Resume,
  Manual,
};

enum class FireOutcome : std::uint8_t {
  Completed,
  AlreadyRan,
  Busy,
  Failed,
};

[[nodiscard]] auto trigger_state_name(TriggerState s) noexcept
    -> std::string_view;
[[nodiscard]] auto fire_source_name(FireSource s) noexcept -> std::string_view;
[[nodiscard]] auto fire_outcome_name(FireOutcome o) noexcept
    -> std::string_view;

// Runs a job at most once per local calendar day.
//
// A background thread sleeps until the next local `fire_time` and fires;
// on_resume() fires immediately to catch up on a day missed while the
// process was suspended. The last successful day is persisted as the run
// marker, so a restart on the same day does not run the job again. Only one
// job runs at a time; a fire that finds one in progress returns Busy.
class DailyTrigger {
public:
  using TimePoint = std::chrono::system_clock::time_point;
  using Job = std::move_only_function<Result<void>(CivilDate)>;

  DailyTrigger(Store& store, const Clock& clock, TimeOfDay fire_time, Job job);
  ~DailyTrigger();

  DailyTrigger(const DailyTrigger&) = delete;
  auto operator=(const DailyTrigger&) -> DailyTrigger& = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load();
  }

  // `force` ignores the run marker (the day is still recorded on success).
  auto fire(FireSource source, bool force = false) -> FireOutcome;
  auto on_resume() -> FireOutcome;

  // Makes the timer thread re-read the clock.
  auto wake() -> void;

  [[nodiscard]] auto state() const noexcept -> TriggerState {
    return state_.load();
  }
  [[nodiscard]] auto next_fire_time() const -> TimePoint {
    return clock_.next_local(clock_.now(), fire_time_);
  }
  [[nodiscard]] auto fire_time() const noexcept -> TimeOfDay {
    return fire_time_;
  }

private:
  auto run_loop() -> void;

  Store& store_;
  const Clock& clock_;
  TimeOfDay fire_time_;
  Job job_;

  int event_fd_{-1};
  std::thread loop_thread_;
  alignas(kCacheLineSize) std::atomic<bool> running_{false};
  alignas(kCacheLineSize) std::atomic<bool> in_progress_{false};
  std::atomic<TriggerState> state_{TriggerState::Idle};
};

}  // namespace dailyops

#pragma once

#include "dailyops/core/error.hpp"

#include <chrono>
#include <compare>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace dailyops {

// Date-only value in the proleptic Gregorian calendar. No time zone attached;
// which calendar day "today" is gets decided by a Clock.
class CivilDate {
public:
  CivilDate() = default;
  explicit CivilDate(std::chrono::sys_days days) noexcept : days_(days) {}

  // Unchecked construction for literals in code and tests.
  [[nodiscard]] static auto from_ymd(int y, unsigned m, unsigned d) noexcept
      -> CivilDate;

  // Parses "YYYY-MM-DD"; rejects anything else, including impossible dates.
  [[nodiscard]] static auto parse(std::string_view text) -> Result<CivilDate>;

  [[nodiscard]] auto ymd() const noexcept -> std::chrono::year_month_day {
    return std::chrono::year_month_day{days_};
  }
  [[nodiscard]] auto year() const noexcept -> int;
  [[nodiscard]] auto month() const noexcept -> unsigned;
  [[nodiscard]] auto day() const noexcept -> unsigned;
  [[nodiscard]] auto weekday() const noexcept -> std::chrono::weekday {
    return std::chrono::weekday{days_};
  }
  // ISO-8601 week number (1..53); weeks start on Monday and week 1 holds
  // the year's first Thursday.
  [[nodiscard]] auto iso_week() const noexcept -> unsigned;

  [[nodiscard]] auto sys_days() const noexcept -> std::chrono::sys_days {
    return days_;
  }
  [[nodiscard]] auto add_days(int n) const noexcept -> CivilDate {
    return CivilDate{days_ + std::chrono::days{n}};
  }
  [[nodiscard]] auto str() const -> std::string;

  [[nodiscard]] friend auto operator<=>(const CivilDate&, const CivilDate&) = default;
  [[nodiscard]] friend auto operator==(const CivilDate&, const CivilDate&) -> bool = default;

private:
  std::chrono::sys_days days_{};
};

// Three-letter lowercase abbreviation: "sun", "mon", ... "sat"
[[nodiscard]] auto weekday_abbrev(std::chrono::weekday wd) noexcept
    -> std::string_view;

// Accepts "mon", "Mon", "monday", " MON " and friends.
[[nodiscard]] auto parse_weekday(std::string_view text) noexcept
    -> std::optional<std::chrono::weekday>;

// Wall-clock time of day, minute precision.
struct TimeOfDay {
  int hour{0};
  int minute{0};

  [[nodiscard]] static auto parse(std::string_view text) -> Result<TimeOfDay>;
  [[nodiscard]] auto since_midnight() const noexcept -> std::chrono::minutes {
    return std::chrono::hours{hour} + std::chrono::minutes{minute};
  }
  [[nodiscard]] auto str() const -> std::string {
    return std::format("{:02d}:{:02d}", hour, minute);
  }
};

// Source of "now" and of the local UTC offset. Everything that cares about
// calendar days asks a Clock, so tests can pin both.
class Clock {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  virtual ~Clock() = default;

  [[nodiscard]] virtual auto now() const -> TimePoint = 0;
  [[nodiscard]] virtual auto utc_offset(TimePoint at) const
      -> std::chrono::seconds = 0;

  [[nodiscard]] auto local_date(TimePoint at) const -> CivilDate;
  [[nodiscard]] auto today() const -> CivilDate {
    return local_date(now());
  }

  // First instant strictly after `after` whose local wall-clock reads `at`.
  [[nodiscard]] auto next_local(TimePoint after, TimeOfDay at) const
      -> TimePoint;
};

// Real time, local zone from the C library (TZ / /etc/localtime).
class SystemClock final : public Clock {
public:
  [[nodiscard]] auto now() const -> TimePoint override;
  [[nodiscard]] auto utc_offset(TimePoint at) const
      -> std::chrono::seconds override;
};

}  // namespace dailyops

template <>
struct std::formatter<dailyops::CivilDate> : std::formatter<std::string> {
  auto format(const dailyops::CivilDate& d, auto& ctx) const {
    return std::formatter<std::string>::format(d.str(), ctx);
  }
};

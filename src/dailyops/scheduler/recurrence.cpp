#include "dailyops/scheduler/recurrence.hpp"

#include "dailyops/model/routine.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ranges>
#include <string>
#include <utility>

namespace dailyops {

namespace {

constexpr std::array<std::string_view, 10> kFrequencyNames = {
    "daily",   "weekdays",  "weekends", "weekly",   "bi-weekly",
    "monthly", "quarterly", "yearly",   "day-list", "unrecognized",
};

struct Alias {
  std::string_view text;
  Frequency frequency;
};

constexpr std::array<Alias, 10> kAliases = {{
    {"daily", Frequency::Daily},
    {"weekdays", Frequency::Weekdays},
    {"weekends", Frequency::Weekends},
    {"weekly", Frequency::Weekly},
    {"bi-weekly", Frequency::BiWeekly},
    {"biweekly", Frequency::BiWeekly},
    {"monthly", Frequency::Monthly},
    {"quarterly", Frequency::Quarterly},
    {"yearly", Frequency::Yearly},
    {"annually", Frequency::Yearly},
}};

auto normalize(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (!std::isspace(c)) {
      out.push_back(static_cast<char>(std::tolower(c)));
    }
  }
  return out;
}

}  // namespace

auto frequency_name(Frequency f) noexcept -> std::string_view {
  auto idx = std::to_underlying(f);
  return idx < kFrequencyNames.size() ? kFrequencyNames[idx] : "unrecognized";
}

auto DaySet::parse(std::string_view text) -> DaySet {
  DaySet set;
  for (auto token : text | std::views::split(',')) {
    if (auto wd = parse_weekday(std::string_view{token.begin(), token.end()})) {
      set.insert(*wd);
    }
  }
  return set;
}

auto RecurrenceSpec::parse(std::string_view text) -> RecurrenceSpec {
  auto norm = normalize(text);

  auto it = std::ranges::find(kAliases, std::string_view{norm}, &Alias::text);
  if (it != kAliases.end()) {
    return {it->frequency, {}};
  }

  // A lone day name ("monday") is not a list.
  if (norm.contains(',')) {
    return {Frequency::DayList, DaySet::parse(norm)};
  }
  return {};
}

auto parse_day_gate(const std::optional<std::string>& text)
    -> std::optional<DaySet> {
  if (!text || normalize(*text).empty()) {
    return std::nullopt;
  }
  return DaySet::parse(*text);
}

auto is_due(const RecurrenceSpec& spec, const std::optional<DaySet>& gate,
            CivilDate date) noexcept -> bool {
  using std::chrono::Monday;
  using std::chrono::Saturday;
  using std::chrono::Sunday;

  auto wd = date.weekday();
  if (gate && !gate->contains(wd)) {
    return false;
  }

  switch (spec.frequency) {
    case Frequency::Daily:
    case Frequency::Weekly:
      return true;
    case Frequency::Weekdays:
      return wd != Saturday && wd != Sunday;
    case Frequency::Weekends:
      return wd == Saturday || wd == Sunday;
    case Frequency::BiWeekly:
      return wd == Monday && date.iso_week() % 2 == 0;
    case Frequency::Monthly:
      return date.day() == 1;
    case Frequency::Quarterly:
      return date.day() == 1 && (date.month() - 1) % 3 == 0;
    case Frequency::Yearly:
      return date.day() == 1 && date.month() == 1;
    case Frequency::DayList:
      return spec.days.contains(wd);
    case Frequency::Unrecognized:
      return false;
  }
  return false;
}

auto is_due(const RoutineTemplate& tpl, CivilDate date) -> bool {
  return is_due(RecurrenceSpec::parse(tpl.recurrence),
                parse_day_gate(tpl.days_of_week), date);
}

}  // namespace dailyops

#pragma once

#include "dailyops/core/calendar.hpp"

#include <bitset>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dailyops {

struct RoutineTemplate;

enum class Frequency : std::uint8_t {
  Daily,
  Weekdays,
  Weekends,
  Weekly,
  BiWeekly,
  Monthly,
  Quarterly,
  Yearly,
  DayList,
  Unrecognized,
};

[[nodiscard]] auto frequency_name(Frequency f) noexcept -> std::string_view;

// Set of weekdays, indexed by std::chrono::weekday::c_encoding() (0 = Sunday).
class DaySet {
public:
  DaySet() = default;

  // Comma-separated day names ("mon,wed,fri", "Monday, Friday"). Tokens that
  // are not day names are dropped.
  [[nodiscard]] static auto parse(std::string_view text) -> DaySet;

  auto insert(std::chrono::weekday wd) -> void { bits_.set(wd.c_encoding()); }
  [[nodiscard]] auto contains(std::chrono::weekday wd) const -> bool {
    return bits_.test(wd.c_encoding());
  }
  [[nodiscard]] auto empty() const -> bool { return bits_.none(); }
  [[nodiscard]] auto size() const -> std::size_t { return bits_.count(); }

  [[nodiscard]] friend auto operator==(const DaySet&, const DaySet&) -> bool = default;

private:
  std::bitset<7> bits_;
};

// A template's recurrence text in parsed form. Parsing never fails; text
// outside the vocabulary yields Frequency::Unrecognized, which is never due.
struct RecurrenceSpec {
  Frequency frequency{Frequency::Unrecognized};
  DaySet days;  // only meaningful for Frequency::DayList

  [[nodiscard]] static auto parse(std::string_view text) -> RecurrenceSpec;
};

// The explicit day-of-week gate of a template. nullopt (or blank text) means
// no gate; text with no recognizable day yields an empty set, which admits
// no date at all.
[[nodiscard]] auto parse_day_gate(const std::optional<std::string>& text)
    -> std::optional<DaySet>;

[[nodiscard]] auto is_due(const RecurrenceSpec& spec,
                          const std::optional<DaySet>& gate,
                          CivilDate date) noexcept -> bool;

[[nodiscard]] auto is_due(const RoutineTemplate& tpl, CivilDate date) -> bool;

}  // namespace dailyops

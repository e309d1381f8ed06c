#include "dailyops/model/operational_dataset.hpp"

#include "dailyops/scheduler/recurrence.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <ranges>
#include <unordered_set>

namespace dailyops {

namespace {

constexpr std::array<std::string_view, 11> kCategories = {
    "cleaning",   "maintenance", "inspection", "repair",
    "sanitation", "operations",  "emergency",  "delivery",
    "security",   "heating",     "dsny operations",
};

constexpr std::array<std::string_view, 3> kSkillLevels = {
    "basic",
    "intermediate",
    "advanced",
};

auto lower(std::string_view s) -> std::string {
  std::string out{s};
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

auto valid_hour(const std::optional<int>& h) -> bool {
  return !h || (*h >= 0 && *h <= 23);
}

}  // namespace

auto validate_dataset(const OperationalDataset& ds)
    -> std::vector<std::string> {
  std::vector<std::string> problems;

  std::unordered_set<WorkerId> workers;
  for (const auto& w : ds.workers) {
    if (w.id.empty()) {
      problems.push_back(std::format("worker '{}' has no id", w.name));
      continue;
    }
    if (!workers.insert(w.id).second) {
      problems.push_back(std::format("duplicate worker id {}", w.id));
    }
    if (w.name.empty()) {
      problems.push_back(std::format("worker {} has no name", w.id));
    }
  }

  std::unordered_set<BuildingId> buildings;
  for (const auto& b : ds.buildings) {
    if (b.id.empty()) {
      problems.push_back(std::format("building '{}' has no id", b.name));
      continue;
    }
    if (!buildings.insert(b.id).second) {
      problems.push_back(std::format("duplicate building id {}", b.id));
    }
    if (b.name.empty()) {
      problems.push_back(std::format("building {} has no name", b.id));
    }
  }

  for (const auto& [idx, t] : ds.tasks | std::views::enumerate) {
    auto where = std::format("task #{} '{}'", idx, t.title);
    if (t.title.empty()) {
      problems.push_back(std::format("{}: empty title", where));
    }
    if (!workers.contains(t.worker_id)) {
      problems.push_back(
          std::format("{}: unknown worker {}", where, t.worker_id));
    }
    if (!buildings.contains(t.building_id)) {
      problems.push_back(
          std::format("{}: unknown building {}", where, t.building_id));
    }
    if (std::ranges::find(kCategories, lower(t.category)) ==
        kCategories.end()) {
      problems.push_back(
          std::format("{}: unknown category '{}'", where, t.category));
    }
    if (std::ranges::find(kSkillLevels, lower(t.skill_level)) ==
        kSkillLevels.end()) {
      problems.push_back(
          std::format("{}: unknown skill level '{}'", where, t.skill_level));
    }
    if (RecurrenceSpec::parse(t.recurrence).frequency ==
        Frequency::Unrecognized) {
      problems.push_back(std::format(
          "{}: recurrence '{}' is never due", where, t.recurrence));
    }
    if (!valid_hour(t.start_hour) || !valid_hour(t.end_hour)) {
      problems.push_back(std::format("{}: hour out of range", where));
    } else if (t.start_hour && t.end_hour && *t.start_hour > *t.end_hour) {
      problems.push_back(std::format("{}: start_hour {} after end_hour {}",
                                     where, *t.start_hour, *t.end_hour));
    }
    if (auto gate = parse_day_gate(t.days_of_week); gate && gate->empty()) {
      problems.push_back(std::format("{}: days_of_week '{}' names no day",
                                     where, *t.days_of_week));
    }
    if (t.estimated_duration_minutes <= 0) {
      problems.push_back(std::format("{}: non-positive duration", where));
    }
  }

  std::unordered_set<WorkerId> capable;
  for (const auto& c : ds.capabilities) {
    if (!workers.contains(c.worker_id)) {
      problems.push_back(
          std::format("capabilities for unknown worker {}", c.worker_id));
    }
    if (!capable.insert(c.worker_id).second) {
      problems.push_back(
          std::format("duplicate capabilities for worker {}", c.worker_id));
    }
  }

  return problems;
}

}  // namespace dailyops

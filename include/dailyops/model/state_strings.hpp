#pragma once

#include "dailyops/model/routine.hpp"

#include <algorithm>
#include <array>
#include <string_view>
#include <utility>

namespace dailyops {

namespace detail {

constexpr std::array<std::string_view, 4> kPriorityNames = {
    "low",
    "normal",
    "high",
    "urgent",
};

constexpr std::array<std::string_view, 2> kInstanceStatusNames = {
    "pending",
    "completed",
};

}  // namespace detail

[[nodiscard]] inline auto priority_name(TaskPriority p) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(p);
  return idx < detail::kPriorityNames.size() ? detail::kPriorityNames[idx]
                                             : "normal";
}

[[nodiscard]] inline auto parse_priority(std::string_view name) noexcept
    -> TaskPriority {
  auto it = std::ranges::find(detail::kPriorityNames, name);
  if (it != detail::kPriorityNames.end()) {
    return static_cast<TaskPriority>(
        std::ranges::distance(detail::kPriorityNames.begin(), it));
  }
  return TaskPriority::Normal;
}

[[nodiscard]] inline auto instance_status_name(InstanceStatus s) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(s);
  return idx < detail::kInstanceStatusNames.size()
             ? detail::kInstanceStatusNames[idx]
             : "pending";
}

[[nodiscard]] inline auto parse_instance_status(std::string_view name) noexcept
    -> InstanceStatus {
  auto it = std::ranges::find(detail::kInstanceStatusNames, name);
  if (it != detail::kInstanceStatusNames.end()) {
    return static_cast<InstanceStatus>(
        std::ranges::distance(detail::kInstanceStatusNames.begin(), it));
  }
  return InstanceStatus::Pending;
}

}  // namespace dailyops

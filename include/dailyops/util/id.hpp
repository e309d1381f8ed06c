#pragma once

#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace dailyops {

// Phantom type tags for type-safe ID disambiguation
struct WorkerTag {};
struct BuildingTag {};
struct TemplateTag {};
struct InstanceTag {};
struct SessionTag {};
struct CompletionTag {};
struct AttachmentTag {};
struct StepTag {};

// Type-safe ID wrapper using phantom type pattern
// Prevents accidental mixing of different ID types at compile time
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }
  [[nodiscard]] auto c_str() const -> const char* { return value_.c_str(); }

  [[nodiscard]] explicit operator std::string() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs, const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs) -> bool = default;

private:
  std::string value_;
};

using WorkerId = TypedId<WorkerTag>;
using BuildingId = TypedId<BuildingTag>;
using TemplateId = TypedId<TemplateTag>;
using InstanceId = TypedId<InstanceTag>;
using SessionId = TypedId<SessionTag>;
using CompletionId = TypedId<CompletionTag>;
using AttachmentId = TypedId<AttachmentTag>;
using StepId = TypedId<StepTag>;

namespace detail {
inline auto generate_short_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  return std::format("{:08x}", dis(gen));
}
}  // namespace detail

// Instance ids embed the template and date so log lines stay readable:
// "<template>@<YYYY-MM-DD>_<8 hex>"
inline auto generate_instance_id(const TemplateId& template_id,
                                 std::string_view date) -> InstanceId {
  return InstanceId{std::format("{}@{}_{}", template_id.value(), date,
                                detail::generate_short_uuid())};
}

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace dailyops

template <typename Tag>
struct std::hash<dailyops::TypedId<Tag>> {
  auto operator()(const dailyops::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<dailyops::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const dailyops::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};

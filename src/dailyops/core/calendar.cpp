#include "dailyops/core/calendar.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <ctime>
#include <ranges>

namespace dailyops {
namespace {

constexpr std::array<std::string_view, 7> kDowAbbrev{"sun", "mon", "tue", "wed",
                                                     "thu", "fri", "sat"};
constexpr std::array<std::string_view, 7> kDowFull{
    "sunday", "monday", "tuesday", "wednesday", "thursday", "friday",
    "saturday"};

constexpr auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

auto trim(std::string_view s) -> std::string_view {
  auto start = std::ranges::find_if_not(s, is_space);
  auto end = std::ranges::find_if_not(s | std::views::reverse, is_space);
  if (start == s.end())
    return {};
  return {start, end.base()};
}

template <typename T>
auto parse_number(std::string_view s) -> std::optional<T> {
  T value{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec == std::errc{} && ptr == s.data() + s.size()) {
    return value;
  }
  return std::nullopt;
}

auto all_digits(std::string_view s) -> bool {
  return !s.empty() && std::ranges::all_of(s, [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

}  // namespace

auto CivilDate::from_ymd(int y, unsigned m, unsigned d) noexcept -> CivilDate {
  return CivilDate{std::chrono::sys_days{
      std::chrono::year{y} / std::chrono::month{m} / std::chrono::day{d}}};
}

auto CivilDate::parse(std::string_view text) -> Result<CivilDate> {
  text = trim(text);
  if (text.size() != 10 || text[4] != '-' || text[7] != '-')
    return fail(Error::ParseError);

  auto ys = text.substr(0, 4);
  auto ms = text.substr(5, 2);
  auto ds = text.substr(8, 2);
  if (!all_digits(ys) || !all_digits(ms) || !all_digits(ds))
    return fail(Error::ParseError);

  auto y = parse_number<int>(ys);
  auto m = parse_number<unsigned>(ms);
  auto d = parse_number<unsigned>(ds);
  if (!y || !m || !d)
    return fail(Error::ParseError);

  std::chrono::year_month_day ymd{std::chrono::year{*y},
                                  std::chrono::month{*m},
                                  std::chrono::day{*d}};
  if (!ymd.ok())
    return fail(Error::ParseError);
  return ok(CivilDate{std::chrono::sys_days{ymd}});
}

auto CivilDate::year() const noexcept -> int {
  return static_cast<int>(ymd().year());
}

auto CivilDate::month() const noexcept -> unsigned {
  return static_cast<unsigned>(ymd().month());
}

auto CivilDate::day() const noexcept -> unsigned {
  return static_cast<unsigned>(ymd().day());
}

auto CivilDate::iso_week() const noexcept -> unsigned {
  using namespace std::chrono;
  // The Thursday of this date's Monday-based week decides the ISO year.
  auto monday_offset = static_cast<int>(weekday().iso_encoding()) - 1;
  auto thursday = days_ - days{monday_offset} + days{3};
  auto iso_year = year_month_day{thursday}.year();
  auto jan1 = std::chrono::sys_days{iso_year / January / 1};
  return static_cast<unsigned>((thursday - jan1).count() / 7 + 1);
}

auto CivilDate::str() const -> std::string {
  auto d = ymd();
  return std::format("{:04d}-{:02d}-{:02d}", static_cast<int>(d.year()),
                     static_cast<unsigned>(d.month()),
                     static_cast<unsigned>(d.day()));
}

auto weekday_abbrev(std::chrono::weekday wd) noexcept -> std::string_view {
  return kDowAbbrev[wd.c_encoding() % 7];
}

auto parse_weekday(std::string_view text) noexcept
    -> std::optional<std::chrono::weekday> {
  text = trim(text);
  if (text.size() < 3 || text.size() > 9)
    return std::nullopt;

  std::array<char, 9> lower{};
  for (std::size_t i = 0; i < text.size(); ++i) {
    lower[i] = static_cast<char>(
        std::tolower(static_cast<unsigned char>(text[i])));
  }
  std::string_view word{lower.data(), text.size()};

  for (unsigned i = 0; i < kDowAbbrev.size(); ++i) {
    if (word == kDowAbbrev[i] || word == kDowFull[i]) {
      return std::chrono::weekday{i};
    }
  }
  return std::nullopt;
}

auto TimeOfDay::parse(std::string_view text) -> Result<TimeOfDay> {
  text = trim(text);
  auto colon = text.find(':');
  if (colon == std::string_view::npos)
    return fail(Error::InvalidArgument);

  auto hs = text.substr(0, colon);
  auto ms = text.substr(colon + 1);
  if (!all_digits(hs) || ms.size() != 2 || !all_digits(ms))
    return fail(Error::InvalidArgument);

  auto h = parse_number<int>(hs);
  auto m = parse_number<int>(ms);
  if (!h || !m || *h < 0 || *h > 23 || *m < 0 || *m > 59)
    return fail(Error::InvalidArgument);
  return ok(TimeOfDay{*h, *m});
}

auto Clock::local_date(TimePoint at) const -> CivilDate {
  return CivilDate{std::chrono::floor<std::chrono::days>(at + utc_offset(at))};
}

auto Clock::next_local(TimePoint after, TimeOfDay at) const -> TimePoint {
  using namespace std::chrono;
  auto offset = utc_offset(after);
  auto local = after + offset;
  auto candidate = floor<days>(local) + at.since_midnight();
  if (candidate <= local) {
    candidate += days{1};
  }

  TimePoint result = candidate - offset;
  // The offset may differ on the far side of a DST switch.
  if (auto shifted = utc_offset(result); shifted != offset) {
    result = candidate - shifted;
  }
  if (result <= after) {
    result += days{1};
  }
  return result;
}

auto SystemClock::now() const -> TimePoint {
  return std::chrono::system_clock::now();
}

auto SystemClock::utc_offset(TimePoint at) const -> std::chrono::seconds {
  auto t = std::chrono::system_clock::to_time_t(at);
  std::tm tm{};
  localtime_r(&t, &tm);
  return std::chrono::seconds{tm.tm_gmtoff};
}

}  // namespace dailyops

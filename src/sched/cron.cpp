#include "sched/cron.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <sstream>
#include <string_view>
#include <vector>

namespace orchestra::sched {
namespace {

constexpr std::array<std::string_view, 12> kMonthNames = {"jan", "feb", "mar", "apr", "may", "jun",
                                                          "jul", "aug", "sep", "oct", "nov", "dec"};
constexpr std::array<std::string_view, 7> kWeekdayNames = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};

// Four years of minutes covers every leap-day expression.
constexpr int kSearchDays = 366 * 4 + 1;

struct FieldSpec {
  const char* name;
  int min;
  int max;
  const std::string_view* names;
  std::size_t name_count;
  int name_base;
};

std::string lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::vector<std::string_view> split(std::string_view value, const char separator) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    const auto pos = value.find(separator, start);
    parts.push_back(value.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
    if (pos == std::string_view::npos) {
      break;
    }
    start = pos + 1;
  }
  return parts;
}

std::optional<int> parse_value(std::string_view token, const FieldSpec& spec) {
  int value = 0;
  const auto* end = token.data() + token.size();
  const auto [ptr, ec] = std::from_chars(token.data(), end, value);
  if (ec == std::errc() && ptr == end) {
    return value;
  }

  if (spec.names != nullptr) {
    const auto needle = lower(token);
    for (std::size_t i = 0; i < spec.name_count; ++i) {
      if (spec.names[i] == needle) {
        return static_cast<int>(i) + spec.name_base;
      }
    }
  }
  return std::nullopt;
}

core::Error invalid(const std::string& expression, const std::string& why) {
  return core::make_error(core::ErrorKind::invalid_schedule, "cron expression '" + expression + "': " + why);
}

// Sets the bits of `out` selected by one comma-separated field.
template <std::size_t N>
std::optional<std::string> parse_field(std::string_view field, const FieldSpec& spec, std::bitset<N>& out) {
  for (const auto item : split(field, ',')) {
    if (item.empty()) {
      return std::string("empty list item in ") + spec.name;
    }

    std::string_view range = item;
    int step = 1;
    if (const auto slash = item.find('/'); slash != std::string_view::npos) {
      range = item.substr(0, slash);
      const auto step_text = item.substr(slash + 1);
      const auto [ptr, ec] = std::from_chars(step_text.data(), step_text.data() + step_text.size(), step);
      if (ec != std::errc() || ptr != step_text.data() + step_text.size() || step <= 0 ||
          step > spec.max - spec.min + 1) {
        return std::string("bad step in ") + spec.name;
      }
    }

    int low = spec.min;
    int high = spec.max;
    if (range != "*") {
      const auto dash = range.find('-');
      const auto first = parse_value(range.substr(0, dash), spec);
      if (!first.has_value()) {
        return std::string("bad value in ") + spec.name;
      }
      low = *first;
      high = *first;
      if (dash != std::string_view::npos) {
        const auto last = parse_value(range.substr(dash + 1), spec);
        if (!last.has_value()) {
          return std::string("bad range end in ") + spec.name;
        }
        high = *last;
      } else if (item.find('/') != std::string_view::npos) {
        high = spec.max;
      }
    }

    if (low < spec.min || high > spec.max || low > high) {
      return std::string("out of range value in ") + spec.name;
    }
    for (int v = low; v <= high; v += step) {
      out.set(static_cast<std::size_t>(v));
    }
  }
  return std::nullopt;
}

}  // namespace

core::Result<CronExpression> CronExpression::parse(const std::string& expression) {
  std::istringstream input(expression);
  std::vector<std::string> fields;
  std::string field;
  while (input >> field) {
    fields.push_back(field);
  }
  if (fields.size() != 5) {
    return invalid(expression, "expected 5 fields, got " + std::to_string(fields.size()));
  }

  CronExpression cron;
  cron.text_ = expression;

  const FieldSpec minute{"minute", 0, 59, nullptr, 0, 0};
  const FieldSpec hour{"hour", 0, 23, nullptr, 0, 0};
  const FieldSpec day{"day-of-month", 1, 31, nullptr, 0, 0};
  const FieldSpec month{"month", 1, 12, kMonthNames.data(), kMonthNames.size(), 1};
  const FieldSpec weekday{"day-of-week", 0, 7, kWeekdayNames.data(), kWeekdayNames.size(), 0};

  std::bitset<8> weekdays;
  std::optional<std::string> problem;
  if ((problem = parse_field(fields[0], minute, cron.minutes_)) ||
      (problem = parse_field(fields[1], hour, cron.hours_)) ||
      (problem = parse_field(fields[2], day, cron.days_of_month_)) ||
      (problem = parse_field(fields[3], month, cron.months_)) ||
      (problem = parse_field(fields[4], weekday, weekdays))) {
    return invalid(expression, *problem);
  }

  for (std::size_t d = 0; d < 7; ++d) {
    cron.days_of_week_[d] = weekdays[d];
  }
  if (weekdays[7]) {
    cron.days_of_week_.set(0);
  }
  return cron;
}

bool CronExpression::matches(const core::TimePoint time) const {
  using namespace std::chrono;
  const auto minute_point = floor<minutes>(time);
  const auto day_point = floor<days>(minute_point);
  const year_month_day ymd{day_point};
  const hh_mm_ss hms{minute_point - day_point};
  const weekday wd{day_point};

  return minutes_[static_cast<std::size_t>(hms.minutes().count())] &&
         hours_[static_cast<std::size_t>(hms.hours().count())] &&
         days_of_month_[static_cast<unsigned>(ymd.day())] && months_[static_cast<unsigned>(ymd.month())] &&
         days_of_week_[wd.c_encoding()];
}

std::optional<core::TimePoint> CronExpression::next_after(const core::TimePoint from) const {
  using namespace std::chrono;
  auto candidate = ceil<minutes>(from);

  // Walk whole days until the date matches, then minutes within the day.
  const auto limit = candidate + days(kSearchDays);
  while (candidate < limit) {
    const auto day_point = floor<days>(candidate);
    const year_month_day ymd{day_point};
    const weekday wd{day_point};
    const bool day_ok = days_of_month_[static_cast<unsigned>(ymd.day())] &&
                        months_[static_cast<unsigned>(ymd.month())] && days_of_week_[wd.c_encoding()];
    if (!day_ok) {
      candidate = day_point + days(1);
      continue;
    }

    const auto next_day = day_point + days(1);
    for (; candidate < next_day; candidate += minutes(1)) {
      const hh_mm_ss hms{candidate - day_point};
      if (!hours_[static_cast<std::size_t>(hms.hours().count())]) {
        candidate = day_point + hms.hours() + hours(1) - minutes(1);
        continue;
      }
      if (minutes_[static_cast<std::size_t>(hms.minutes().count())]) {
        return time_point_cast<core::Clock::duration>(candidate);
      }
    }
    candidate = next_day;
  }
  return std::nullopt;
}

}  // namespace orchestra::sched

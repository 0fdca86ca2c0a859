#pragma once

#include <bitset>
#include <optional>
#include <string>

#include "core/result.hpp"
#include "core/timestamp.hpp"

namespace orchestra::sched {

// Five-field crontab expression: minute hour day-of-month month day-of-week.
// Supports '*', lists, ranges, steps, month/weekday names and 7 as Sunday.
// All fields must match (no day-of-month/day-of-week OR rule). Evaluated in
// UTC with minute resolution.
class CronExpression {
 public:
  static core::Result<CronExpression> parse(const std::string& expression);

  // First whole minute at or after `from` that matches.
  [[nodiscard]] std::optional<core::TimePoint> next_after(core::TimePoint from) const;

  [[nodiscard]] bool matches(core::TimePoint time) const;
  [[nodiscard]] const std::string& text() const noexcept { return text_; }

 private:
  CronExpression() = default;

  std::string text_;
  std::bitset<60> minutes_;
  std::bitset<24> hours_;
  std::bitset<32> days_of_month_;
  std::bitset<13> months_;
  std::bitset<7> days_of_week_;
};

}  // namespace orchestra::sched

#pragma once

#include <chrono>
#include <cstdint>

namespace orchestra::core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline std::int64_t to_unix_ms(const TimePoint time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

inline TimePoint from_unix_ms(const std::int64_t ms) {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

// Persisted timestamps keep millisecond resolution only.
inline TimePoint now_ms() {
  return from_unix_ms(to_unix_ms(Clock::now()));
}

}  // namespace orchestra::core

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "core/timestamp.hpp"

namespace orchestra::model {

enum class schedule_kind : std::uint8_t {
    ONE_TIME = 0,
    RECURRING = 1,
    CRON = 2,
};

// start_at drives ONE_TIME, interval drives RECURRING, cron_expression drives
// CRON. start_at/end_at additionally bound RECURRING and CRON.
struct schedule_config {
    schedule_kind kind{schedule_kind::ONE_TIME};
    std::optional<core::TimePoint> start_at{};
    std::optional<core::TimePoint> end_at{};
    std::optional<std::chrono::milliseconds> interval{};
    std::optional<std::string> cron_expression{};
    bool retry_on_failure{true};
    int max_retries{3};
    std::chrono::milliseconds retry_delay{std::chrono::minutes(5)};
};

const char* to_string(schedule_kind kind) noexcept;

}  // namespace orchestra::model

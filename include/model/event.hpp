#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/timestamp.hpp"

namespace orchestra::model {

// Advisory only; delivery is FIFO regardless of priority.
enum class event_priority : std::uint8_t {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    CRITICAL = 3,
};

namespace event_types {
inline constexpr const char* kTaskCreated = "task_created";
inline constexpr const char* kTaskStateChanged = "task_state_changed";
inline constexpr const char* kTaskCancelled = "task_cancelled";
inline constexpr const char* kTaskScheduled = "task_scheduled";
inline constexpr const char* kTaskDispatched = "task_dispatched";
inline constexpr const char* kTaskExecuted = "task_executed";
}  // namespace event_types

struct event {
    std::string type;
    nlohmann::json data;
    event_priority priority{event_priority::NORMAL};
    std::optional<core::TimePoint> timestamp{};
    std::optional<std::string> source{};
    std::optional<std::string> id{};
};

const char* to_string(event_priority priority) noexcept;

}  // namespace orchestra::model

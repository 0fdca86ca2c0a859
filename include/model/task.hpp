#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "core/timestamp.hpp"

namespace orchestra::model {

enum class task_state : std::uint8_t {
    PENDING = 0,
    QUEUED = 1,
    RUNNING = 2,
    COMPLETED = 3,
    FAILED = 4,
    CANCELLED = 5,
};

enum class priority_class : std::uint8_t {
    HIGH = 0,
    MEDIUM = 1,
    LOW = 2,
};

inline constexpr int kDefaultPriority = 1;
inline constexpr int kDefaultMaxRetries = 3;

struct task_metadata {
    core::TimePoint created_at{};
    core::TimePoint updated_at{};
    int retries{0};
    int max_retries{kDefaultMaxRetries};
    std::optional<std::string> last_error{};
};

struct task {
    std::string id;
    nlohmann::json payload;
    std::string agent_id;
    int priority{kDefaultPriority};
    task_state state{task_state::PENDING};
    task_metadata metadata{};
};

// Two cuts only: >1 is high, <1 is low, everything else (exactly 1) is medium.
constexpr priority_class priority_class_for(const int priority) noexcept {
    if (priority > 1) {
        return priority_class::HIGH;
    }
    if (priority < 1) {
        return priority_class::LOW;
    }
    return priority_class::MEDIUM;
}

constexpr bool is_terminal(const task_state state) noexcept {
    return state == task_state::COMPLETED || state == task_state::FAILED || state == task_state::CANCELLED;
}

const char* to_string(task_state state) noexcept;
const char* to_string(priority_class cls) noexcept;
std::optional<task_state> parse_task_state(std::string_view value);

// Persisted representation. Timestamps are unix milliseconds; from_json throws
// nlohmann::json::exception or std::invalid_argument on malformed input.
void to_json(nlohmann::json& out, const task& value);
void from_json(const nlohmann::json& in, task& value);

}  // namespace orchestra::model

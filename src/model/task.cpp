#include "model/task.hpp"

#include <stdexcept>

namespace orchestra::model {

const char* to_string(const task_state state) noexcept {
  switch (state) {
    case task_state::PENDING:
      return "pending";
    case task_state::QUEUED:
      return "queued";
    case task_state::RUNNING:
      return "running";
    case task_state::COMPLETED:
      return "completed";
    case task_state::FAILED:
      return "failed";
    case task_state::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

const char* to_string(const priority_class cls) noexcept {
  switch (cls) {
    case priority_class::HIGH:
      return "high";
    case priority_class::MEDIUM:
      return "medium";
    case priority_class::LOW:
      return "low";
  }
  return "unknown";
}

std::optional<task_state> parse_task_state(const std::string_view value) {
  if (value == "pending") return task_state::PENDING;
  if (value == "queued") return task_state::QUEUED;
  if (value == "running") return task_state::RUNNING;
  if (value == "completed") return task_state::COMPLETED;
  if (value == "failed") return task_state::FAILED;
  if (value == "cancelled") return task_state::CANCELLED;
  return std::nullopt;
}

void to_json(nlohmann::json& out, const task& value) {
  nlohmann::json metadata{{"created_at", core::to_unix_ms(value.metadata.created_at)},
                          {"updated_at", core::to_unix_ms(value.metadata.updated_at)},
                          {"retries", value.metadata.retries},
                          {"max_retries", value.metadata.max_retries},
                          {"last_error", nullptr}};
  if (value.metadata.last_error.has_value()) {
    metadata["last_error"] = *value.metadata.last_error;
  }

  out = nlohmann::json{{"id", value.id},
                       {"payload", value.payload},
                       {"agent_id", value.agent_id},
                       {"priority", value.priority},
                       {"state", to_string(value.state)},
                       {"metadata", std::move(metadata)}};
}

void from_json(const nlohmann::json& in, task& value) {
  value.id = in.at("id").get<std::string>();
  value.payload = in.value("payload", nlohmann::json());
  value.agent_id = in.at("agent_id").get<std::string>();
  value.priority = in.value("priority", kDefaultPriority);

  const auto state_name = in.at("state").get<std::string>();
  const auto state = parse_task_state(state_name);
  if (!state.has_value()) {
    throw std::invalid_argument("unknown task state: " + state_name);
  }
  value.state = *state;

  const auto& metadata = in.at("metadata");
  value.metadata.created_at = core::from_unix_ms(metadata.at("created_at").get<std::int64_t>());
  value.metadata.updated_at = core::from_unix_ms(metadata.at("updated_at").get<std::int64_t>());
  value.metadata.retries = metadata.value("retries", 0);
  value.metadata.max_retries = metadata.value("max_retries", kDefaultMaxRetries);
  value.metadata.last_error.reset();
  const auto error_it = metadata.find("last_error");
  if (error_it != metadata.end() && error_it->is_string()) {
    value.metadata.last_error = error_it->get<std::string>();
  }
}

}  // namespace orchestra::model

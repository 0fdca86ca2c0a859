#include "core/result.hpp"

namespace orchestra::core {

const char* to_string(const ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::duplicate_task:
      return "DuplicateTaskError";
    case ErrorKind::task_not_found:
      return "TaskNotFoundError";
    case ErrorKind::agent_not_found:
      return "AgentNotFoundError";
    case ErrorKind::duplicate_schedule:
      return "DuplicateScheduleError";
    case ErrorKind::schedule_not_found:
      return "ScheduleNotFoundError";
    case ErrorKind::invalid_schedule:
      return "InvalidScheduleError";
    case ErrorKind::storage:
      return "StorageError";
    case ErrorKind::queue_full:
      return "QueueFullError";
    case ErrorKind::invalid_transition:
      return "InvalidTransitionError";
    case ErrorKind::shutting_down:
      return "ShuttingDownError";
    case ErrorKind::unreachable:
      return "UnreachableError";
    case ErrorKind::execution_failed:
      return "ExecutionError";
  }
  return "UnknownError";
}

std::string describe(const Error& error) {
  std::string out = to_string(error.kind);
  if (!error.message.empty()) {
    out += ": ";
    out += error.message;
  }
  return out;
}

}  // namespace orchestra::core

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace orchestra::core {

enum class ErrorKind : std::uint8_t {
  duplicate_task,
  task_not_found,
  agent_not_found,
  duplicate_schedule,
  schedule_not_found,
  invalid_schedule,
  storage,
  queue_full,
  invalid_transition,
  shutting_down,
  unreachable,
  execution_failed,
};

const char* to_string(ErrorKind kind) noexcept;

struct Error {
  ErrorKind kind;
  std::string message;
};

// Value-or-error return for every synchronous operation. Never throws for an
// error outcome; callers inspect ok() before touching value().
template <typename T>
class [[nodiscard]] Result {
 public:
  Result(T value) : value_(std::move(value)) {}
  Result(Error error) : error_(std::move(error)) {}

  [[nodiscard]] bool ok() const noexcept { return value_.has_value(); }
  explicit operator bool() const noexcept { return ok(); }

  const T& value() const& { return *value_; }
  T& value() & { return *value_; }
  T&& value() && { return std::move(*value_); }

  const Error& error() const& { return *error_; }
  [[nodiscard]] ErrorKind kind() const { return error_->kind; }

 private:
  std::optional<T> value_;
  std::optional<Error> error_;
};

template <>
class [[nodiscard]] Result<void> {
 public:
  Result() = default;
  Result(Error error) : error_(std::move(error)) {}

  [[nodiscard]] bool ok() const noexcept { return !error_.has_value(); }
  explicit operator bool() const noexcept { return ok(); }

  const Error& error() const& { return *error_; }
  [[nodiscard]] ErrorKind kind() const { return error_->kind; }

 private:
  std::optional<Error> error_;
};

inline Result<void> ok() { return {}; }

inline Error make_error(const ErrorKind kind, std::string message) {
  return Error{kind, std::move(message)};
}

// "DuplicateTaskError: task t1 already exists"
std::string describe(const Error& error);

}  // namespace orchestra::core

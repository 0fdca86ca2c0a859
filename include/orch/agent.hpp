#pragma once

#include <nlohmann/json.hpp>

#include "core/result.hpp"

namespace orchestra::orch {

// Executes a task payload synchronously on a worker thread. Business-level
// failures are returned as ErrorKind::execution_failed; an exception thrown
// from execute() is treated the same way.
class Agent {
 public:
  virtual ~Agent() = default;
  virtual core::Result<nlohmann::json> execute(const nlohmann::json& payload) = 0;
};

}  // namespace orchestra::orch

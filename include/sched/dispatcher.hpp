#pragma once

#include "core/result.hpp"
#include "model/task.hpp"

namespace orchestra::sched {

// Execution layer as seen from the scheduler.
class TaskDispatcher {
 public:
  virtual ~TaskDispatcher() = default;

  virtual core::Result<void> dispatch(const model::task& task) = 0;
  [[nodiscard]] virtual bool reachable() const = 0;
};

}  // namespace orchestra::sched

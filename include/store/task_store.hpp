#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/result.hpp"
#include "model/task.hpp"

namespace orchestra::store {

// Key-value persistence of task records addressed by id. Writes complete
// before returning. Failures of the medium are ErrorKind::storage.
class TaskStore {
 public:
  virtual ~TaskStore() = default;

  virtual core::Result<void> put(const model::task& task) = 0;
  virtual core::Result<std::optional<model::task>> get(const std::string& id) = 0;
  virtual core::Result<std::vector<model::task>> list() = 0;
  virtual core::Result<void> remove(const std::string& id) = 0;
};

}  // namespace orchestra::store

#pragma once

#include <mutex>
#include <unordered_map>

#include "store/task_store.hpp"

namespace orchestra::store {

class MemoryTaskStore final : public TaskStore {
 public:
  core::Result<void> put(const model::task& task) override;
  core::Result<std::optional<model::task>> get(const std::string& id) override;
  core::Result<std::vector<model::task>> list() override;
  core::Result<void> remove(const std::string& id) override;

 private:
  std::mutex mutex_;
  std::unordered_map<std::string, model::task> tasks_;
};

}  // namespace orchestra::store

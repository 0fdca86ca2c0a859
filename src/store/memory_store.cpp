#include "store/memory_store.hpp"

namespace orchestra::store {

core::Result<void> MemoryTaskStore::put(const model::task& task) {
  std::lock_guard<std::mutex> lock(mutex_);
  tasks_.insert_or_assign(task.id, task);
  return core::ok();
}

core::Result<std::optional<model::task>> MemoryTaskStore::get(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return std::optional<model::task>{};
  }
  return std::optional<model::task>{it->second};
}

core::Result<std::vector<model::task>> MemoryTaskStore::list() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<model::task> out;
  out.reserve(tasks_.size());
  for (const auto& [id, task] : tasks_) {
    out.push_back(task);
  }
  return out;
}

core::Result<void> MemoryTaskStore::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  tasks_.erase(id);
  return core::ok();
}

}  // namespace orchestra::store

#include "tasks/task_manager.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace orchestra::tasks {
namespace {

core::Error not_found(const std::string& id) {
  return core::make_error(core::ErrorKind::task_not_found, "task " + id + " not found");
}

}  // namespace

TaskManager::TaskManager(store::TaskStore& store, const int default_max_retries)
    : store_(store), default_max_retries_(default_max_retries) {}

void TaskManager::set_transition_listener(TransitionListener listener) {
  listener_ = std::move(listener);
}

std::deque<std::string>& TaskManager::queue_for(const model::priority_class cls) {
  return queues_[static_cast<std::size_t>(cls)];
}

void TaskManager::enqueue_locked(const model::task& task) {
  auto& queue = queue_for(model::priority_class_for(task.priority));
  if (std::find(queue.begin(), queue.end(), task.id) == queue.end()) {
    queue.push_back(task.id);
  }
}

void TaskManager::dequeue_locked(const std::string& id, const int priority) {
  auto& queue = queue_for(model::priority_class_for(priority));
  const auto it = std::find(queue.begin(), queue.end(), id);
  if (it != queue.end()) {
    queue.erase(it);
  }
}

// Persists `updated`, then mirrors it into the map and the queues.
core::Result<void> TaskManager::commit_locked(model::task updated) {
  if (auto stored = store_.put(updated); !stored) {
    return stored;
  }

  if (updated.state == model::task_state::PENDING) {
    enqueue_locked(updated);
  } else {
    dequeue_locked(updated.id, updated.priority);
  }
  tasks_.insert_or_assign(updated.id, std::move(updated));
  return core::ok();
}

void TaskManager::notify(const std::vector<Transition>& transitions) const {
  if (!listener_) {
    return;
  }
  for (const auto& transition : transitions) {
    listener_(transition.task, transition.previous);
  }
}

core::Result<model::task> TaskManager::create(std::string id, nlohmann::json payload, std::string agent_id,
                                              const int priority, const std::optional<int> max_retries) {
  model::task task{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.find(id) != tasks_.end()) {
      return core::make_error(core::ErrorKind::duplicate_task, "task " + id + " already exists");
    }

    const auto now = core::now_ms();
    task.id = std::move(id);
    task.payload = std::move(payload);
    task.agent_id = std::move(agent_id);
    task.priority = priority;
    task.state = model::task_state::PENDING;
    task.metadata.created_at = now;
    task.metadata.updated_at = now;
    task.metadata.max_retries = max_retries.value_or(default_max_retries_);

    if (auto committed = commit_locked(task); !committed) {
      return committed.error();
    }
  }

  notify({{task, std::nullopt}});
  return task;
}

core::Result<std::optional<model::task>> TaskManager::next_ready() {
  model::task claimed{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::deque<std::string>* source = nullptr;
    for (auto& queue : queues_) {
      if (!queue.empty()) {
        source = &queue;
        break;
      }
    }
    if (source == nullptr) {
      return std::optional<model::task>{};
    }

    claimed = tasks_.at(source->front());
    claimed.state = model::task_state::RUNNING;
    claimed.metadata.updated_at = core::now_ms();
    if (auto committed = commit_locked(claimed); !committed) {
      return committed.error();
    }
  }

  notify({{claimed, model::task_state::PENDING}});
  return std::optional<model::task>{std::move(claimed)};
}

core::Result<model::task_state> TaskManager::update_state(const std::string& id, const model::task_state new_state,
                                                          std::optional<std::string> error) {
  model::task updated{};
  model::task_state previous{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = tasks_.find(id);
    if (it == tasks_.end()) {
      return not_found(id);
    }

    updated = it->second;
    previous = updated.state;
    updated.state = new_state;
    updated.metadata.updated_at = core::now_ms();

    if (error.has_value()) {
      updated.metadata.last_error = std::move(error);
      if (new_state == model::task_state::FAILED) {
        if (updated.metadata.retries < updated.metadata.max_retries) {
          ++updated.metadata.retries;
          updated.state = model::task_state::PENDING;
          std::cerr << "[task_manager] retrying task " << id << " (attempt " << updated.metadata.retries << ")\n";
        } else {
          std::cerr << "[task_manager] task " << id << " failed after " << updated.metadata.retries
                    << " retries: " << *updated.metadata.last_error << '\n';
        }
      }
    }

    if (auto committed = commit_locked(updated); !committed) {
      return committed.error();
    }
  }

  notify({{updated, previous}});
  return updated.state;
}

core::Result<model::task> TaskManager::claim(const std::string& id) {
  model::task claimed{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = tasks_.find(id);
    if (it == tasks_.end()) {
      return not_found(id);
    }

    claimed = it->second;
    if (model::is_terminal(claimed.state)) {
      return core::make_error(core::ErrorKind::invalid_transition,
                              "task " + id + " is " + model::to_string(claimed.state));
    }
    if (claimed.state != model::task_state::PENDING) {
      return claimed;
    }

    claimed.state = model::task_state::QUEUED;
    claimed.metadata.updated_at = core::now_ms();
    if (auto committed = commit_locked(claimed); !committed) {
      return committed.error();
    }
  }

  notify({{claimed, model::task_state::PENDING}});
  return claimed;
}

core::Result<void> TaskManager::cancel(const std::string& id) { return cancel_from(id, false); }

core::Result<void> TaskManager::cancel_unstarted(const std::string& id) { return cancel_from(id, true); }

core::Result<void> TaskManager::cancel_from(const std::string& id, const bool accept_running) {
  model::task cancelled{};
  model::task_state previous{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = tasks_.find(id);
    if (it == tasks_.end()) {
      return not_found(id);
    }

    cancelled = it->second;
    previous = cancelled.state;
    const bool cancellable = previous == model::task_state::PENDING || previous == model::task_state::QUEUED ||
                             (accept_running && previous == model::task_state::RUNNING);
    if (!cancellable) {
      return core::make_error(core::ErrorKind::invalid_transition,
                              "task " + id + " is " + model::to_string(previous) + " and cannot be cancelled");
    }

    cancelled.state = model::task_state::CANCELLED;
    cancelled.metadata.updated_at = core::now_ms();
    if (auto committed = commit_locked(cancelled); !committed) {
      return committed;
    }
  }

  notify({{cancelled, previous}});
  return core::ok();
}

core::Result<std::size_t> TaskManager::load() {
  auto persisted = store_.list();
  if (!persisted) {
    return persisted.error();
  }

  auto tasks = std::move(persisted).value();
  std::sort(tasks.begin(), tasks.end(), [](const model::task& a, const model::task& b) {
    return a.metadata.created_at < b.metadata.created_at;
  });

  std::lock_guard<std::mutex> lock(mutex_);
  tasks_.clear();
  for (auto& queue : queues_) {
    queue.clear();
  }

  std::size_t requeued = 0;
  std::size_t stranded = 0;
  for (auto& task : tasks) {
    if (task.state == model::task_state::PENDING) {
      enqueue_locked(task);
      ++requeued;
    } else if (task.state == model::task_state::QUEUED || task.state == model::task_state::RUNNING) {
      ++stranded;
    }
    const std::string id = task.id;
    tasks_.insert_or_assign(id, std::move(task));
  }

  std::cerr << "[task_manager] loaded " << tasks_.size() << " tasks, re-enqueued " << requeued << '\n';
  if (stranded > 0) {
    std::cerr << "[task_manager] " << stranded << " tasks were in flight at shutdown and stay as persisted\n";
  }
  return requeued;
}

core::Result<std::size_t> TaskManager::cleanup(const core::TimePoint older_than) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for (auto it = tasks_.begin(); it != tasks_.end();) {
    const auto& task = it->second;
    const bool removable =
        task.state == model::task_state::COMPLETED || task.state == model::task_state::CANCELLED;
    if (!removable || task.metadata.updated_at >= older_than) {
      ++it;
      continue;
    }

    if (auto erased = store_.remove(task.id); !erased) {
      return erased.error();
    }
    it = tasks_.erase(it);
    ++removed;
  }
  return removed;
}

std::optional<model::task> TaskManager::get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<model::task> TaskManager::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<model::task> out;
  out.reserve(tasks_.size());
  for (const auto& [id, task] : tasks_) {
    out.push_back(task);
  }
  return out;
}

QueueStatus TaskManager::queue_status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return QueueStatus{.high = queues_[static_cast<std::size_t>(model::priority_class::HIGH)].size(),
                     .medium = queues_[static_cast<std::size_t>(model::priority_class::MEDIUM)].size(),
                     .low = queues_[static_cast<std::size_t>(model::priority_class::LOW)].size()};
}

}  // namespace orchestra::tasks

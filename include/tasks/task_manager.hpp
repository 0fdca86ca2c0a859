#pragma once

#include <array>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/result.hpp"
#include "core/timestamp.hpp"
#include "model/task.hpp"
#include "store/task_store.hpp"

namespace orchestra::tasks {

struct QueueStatus {
  std::size_t high{0};
  std::size_t medium{0};
  std::size_t low{0};
};

// Owns the task state machine and the three priority queues.
//
// A queued id always refers to a task in PENDING state; every other state
// removes the id from its queue. Each mutation is persisted before the
// in-memory map and queues change, so a storage failure leaves both untouched.
class TaskManager {
 public:
  // Called after a committed change, outside the internal lock. `previous` is
  // empty for a newly created task.
  using TransitionListener =
      std::function<void(const model::task& task, std::optional<model::task_state> previous)>;

  explicit TaskManager(store::TaskStore& store, int default_max_retries = model::kDefaultMaxRetries);

  TaskManager(const TaskManager&) = delete;
  TaskManager& operator=(const TaskManager&) = delete;

  // Install before the manager is shared between threads.
  void set_transition_listener(TransitionListener listener);

  core::Result<model::task> create(std::string id, nlohmann::json payload, std::string agent_id,
                                   int priority = model::kDefaultPriority,
                                   std::optional<int> max_retries = std::nullopt);

  // Pops the head of the highest non-empty queue and marks it RUNNING.
  core::Result<std::optional<model::task>> next_ready();

  // FAILED with an error re-enqueues as PENDING while retries remain.
  // Returns the state the task ends up in.
  core::Result<model::task_state> update_state(const std::string& id, model::task_state new_state,
                                               std::optional<std::string> error = std::nullopt);

  // Takes a PENDING task out of its queue for a dispatcher that already holds
  // it and marks it QUEUED. QUEUED and RUNNING tasks are returned unchanged.
  core::Result<model::task> claim(const std::string& id);

  core::Result<void> cancel(const std::string& id);

  // Like cancel(), but also accepts RUNNING. For a dispatcher whose task was
  // marked RUNNING by next_ready() and then withdrawn before any work began.
  core::Result<void> cancel_unstarted(const std::string& id);

  // Rebuilds the task map and the queues from the store. Returns the number of
  // tasks re-enqueued.
  core::Result<std::size_t> load();

  // Removes COMPLETED and CANCELLED tasks last updated before `older_than`.
  core::Result<std::size_t> cleanup(core::TimePoint older_than);

  [[nodiscard]] std::optional<model::task> get(const std::string& id) const;
  [[nodiscard]] std::vector<model::task> list() const;
  [[nodiscard]] QueueStatus queue_status() const;

 private:
  struct Transition {
    model::task task;
    std::optional<model::task_state> previous;
  };

  std::deque<std::string>& queue_for(model::priority_class cls);
  void enqueue_locked(const model::task& task);
  void dequeue_locked(const std::string& id, int priority);
  core::Result<void> commit_locked(model::task updated);
  core::Result<void> cancel_from(const std::string& id, bool accept_running);
  void notify(const std::vector<Transition>& transitions) const;

  store::TaskStore& store_;
  int default_max_retries_;
  TransitionListener listener_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, model::task> tasks_;
  std::array<std::deque<std::string>, 3> queues_;
};

}  // namespace orchestra::tasks

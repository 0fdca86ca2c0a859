#include "orch/orchestrator.hpp"

#include <atomic>
#include <exception>
#include <future>
#include <iostream>
#include <thread>
#include <utility>

namespace orchestra::orch {
namespace {

core::Result<nlohmann::json> invoke(Agent& agent, const nlohmann::json& payload) {
  try {
    return agent.execute(payload);
  } catch (const std::exception& ex) {
    return core::make_error(core::ErrorKind::execution_failed, ex.what());
  } catch (...) {
    return core::make_error(core::ErrorKind::execution_failed, "agent threw a non-standard exception");
  }
}

// Shared between a timed call and the thread running it. `abandoned` is set
// once the caller gave up; the thread then releases its slot in the counter.
struct TimedCall {
  std::mutex mutex;
  bool done{false};
  bool abandoned{false};
};

core::Result<nlohmann::json> invoke_with_timeout(const std::shared_ptr<Agent>& agent, const nlohmann::json& payload,
                                                 const std::chrono::milliseconds timeout,
                                                 const std::shared_ptr<std::atomic<std::size_t>>& abandoned_calls) {
  auto promise = std::make_shared<std::promise<core::Result<nlohmann::json>>>();
  auto future = promise->get_future();
  auto call = std::make_shared<TimedCall>();
  std::thread([agent, payload, promise, call, abandoned_calls]() {
    auto outcome = invoke(*agent, payload);
    {
      std::lock_guard<std::mutex> lock(call->mutex);
      call->done = true;
      if (call->abandoned) {
        --*abandoned_calls;
      }
    }
    promise->set_value(std::move(outcome));
  }).detach();

  if (future.wait_for(timeout) == std::future_status::timeout) {
    std::lock_guard<std::mutex> lock(call->mutex);
    if (!call->done) {
      call->abandoned = true;
      ++*abandoned_calls;
      return core::make_error(core::ErrorKind::execution_failed,
                              "agent timed out after " + std::to_string(timeout.count()) + " ms");
    }
  }
  return future.get();
}

}  // namespace

const char* to_string(const ExecutionStatus status) noexcept {
  switch (status) {
    case ExecutionStatus::NOT_FOUND:
      return "not_found";
    case ExecutionStatus::RUNNING:
      return "running";
    case ExecutionStatus::COMPLETED:
      return "completed";
    case ExecutionStatus::FAILED:
      return "failed";
  }
  return "unknown";
}

Orchestrator::Orchestrator(tasks::TaskManager& task_manager, bus::EventBus& event_bus, const std::size_t workers)
    : task_manager_(task_manager), event_bus_(event_bus), pool_(workers) {}

Orchestrator::~Orchestrator() { shutdown(true); }

void Orchestrator::register_agent(const std::string& agent_id, std::shared_ptr<Agent> agent,
                                  const std::optional<std::chrono::milliseconds> timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  agents_.insert_or_assign(agent_id, Registration{std::move(agent), timeout, 0, 0,
                                                  std::make_shared<std::atomic<std::size_t>>(0)});
  std::cerr << "[orchestrator] registered agent " << agent_id << '\n';
}

void Orchestrator::unregister_agent(const std::string& agent_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (agents_.erase(agent_id) > 0) {
    std::cerr << "[orchestrator] unregistered agent " << agent_id << '\n';
  }
}

core::Result<void> Orchestrator::submit(const model::task& task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!accepting_) {
    return core::make_error(core::ErrorKind::shutting_down, "orchestrator is shut down");
  }

  const auto agent_it = agents_.find(task.agent_id);
  if (agent_it == agents_.end()) {
    return core::make_error(core::ErrorKind::agent_not_found, "agent " + task.agent_id + " not registered");
  }

  const auto existing = executions_.find(task.id);
  if (existing != executions_.end() && !existing->second->handle->finished()) {
    return core::make_error(core::ErrorKind::duplicate_task, "task " + task.id + " already in flight");
  }

  auto claimed = task_manager_.claim(task.id);
  if (!claimed) {
    return claimed.error();
  }

  auto execution = std::make_shared<Execution>();
  execution->context = TaskContext{.task_id = task.id,
                                   .agent_id = task.agent_id,
                                   .priority = task.priority,
                                   .submitted_at = core::Clock::now(),
                                   .start_time = std::nullopt,
                                   .end_time = std::nullopt};
  execution->agent = agent_it->second.agent;
  execution->timeout = agent_it->second.timeout;
  execution->abandoned_calls = agent_it->second.abandoned_calls;
  execution->needs_start = claimed.value().state != model::task_state::RUNNING;

  execution->handle = pool_.submit([this, execution, payload = claimed.value().payload]() { run(execution, payload); });
  if (execution->handle == nullptr) {
    return core::make_error(core::ErrorKind::shutting_down, "worker pool is shut down");
  }

  executions_.insert_or_assign(task.id, execution);
  std::cerr << "[orchestrator] submitted task " << task.id << " to agent " << task.agent_id << " with priority "
            << model::to_string(model::priority_class_for(task.priority)) << '\n';
  return core::ok();
}

void Orchestrator::run(const std::shared_ptr<Execution>& execution, const nlohmann::json& payload) {
  const std::string task_id = execution->context.task_id;
  const std::string agent_id = execution->context.agent_id;

  if (execution->needs_start) {
    if (auto started = task_manager_.update_state(task_id, model::task_state::RUNNING); !started) {
      std::cerr << "[orchestrator] " << core::describe(started.error()) << '\n';
    }
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    execution->context.start_time = core::Clock::now();
  }

  auto outcome = execution->timeout.has_value()
                     ? invoke_with_timeout(execution->agent, payload, *execution->timeout, execution->abandoned_calls)
                     : invoke(*execution->agent, payload);
  const bool success = outcome.ok();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    execution->context.end_time = core::Clock::now();
    if (success) {
      execution->result = outcome.value();
    } else {
      execution->error = outcome.error().message;
    }
  }
  record_outcome(agent_id, success);

  auto final_state = success ? task_manager_.update_state(task_id, model::task_state::COMPLETED)
                             : task_manager_.update_state(task_id, model::task_state::FAILED, outcome.error().message);
  if (!final_state) {
    std::cerr << "[orchestrator] unable to record outcome of " << task_id << ": "
              << core::describe(final_state.error()) << '\n';
  }

  nlohmann::json data{{"task_id", task_id}, {"agent_id", agent_id}, {"success", success}};
  if (success) {
    data["result"] = outcome.value();
  } else {
    data["error"] = outcome.error().message;
  }
  if (final_state) {
    data["state"] = model::to_string(final_state.value());
  }

  publish(model::event{.type = model::event_types::kTaskExecuted,
                       .data = std::move(data),
                       .priority = model::event_priority::HIGH,
                       .timestamp = std::nullopt,
                       .source = std::string("orchestrator"),
                       .id = std::nullopt});
}

void Orchestrator::record_outcome(const std::string& agent_id, const bool success) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = agents_.find(agent_id);
  if (it == agents_.end()) {
    return;
  }
  if (success) {
    ++it->second.completed;
  } else {
    ++it->second.failed;
  }
}

void Orchestrator::publish(model::event event) {
  if (auto published = event_bus_.publish(std::move(event)); !published) {
    std::cerr << "[orchestrator] " << core::describe(published.error()) << '\n';
  }
}

TaskStatus Orchestrator::status(const std::string& task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = executions_.find(task_id);
  if (it == executions_.end()) {
    return TaskStatus{};
  }

  const auto& execution = *it->second;
  TaskStatus out{};
  out.context = execution.context;
  if (execution.handle->current() != WorkHandle::state::DONE) {
    out.status = ExecutionStatus::RUNNING;
    return out;
  }

  if (execution.error.has_value()) {
    out.status = ExecutionStatus::FAILED;
    out.error = execution.error;
  } else {
    out.status = ExecutionStatus::COMPLETED;
    out.result = execution.result;
  }
  return out;
}

bool Orchestrator::cancel(const std::string& task_id) {
  bool claimed_running = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = executions_.find(task_id);
    if (it == executions_.end()) {
      return false;
    }
    if (!pool_.cancel(it->second->handle)) {
      return false;
    }
    claimed_running = !it->second->needs_start;
    executions_.erase(it);
  }

  // Tasks pulled by dispatch_ready are already RUNNING in the task manager
  // although no worker ever picked them up.
  auto cancelled = claimed_running ? task_manager_.cancel_unstarted(task_id) : task_manager_.cancel(task_id);
  if (!cancelled) {
    std::cerr << "[orchestrator] " << core::describe(cancelled.error()) << '\n';
    return false;
  }
  std::cerr << "[orchestrator] cancelled task " << task_id << '\n';
  publish(model::event{.type = model::event_types::kTaskCancelled,
                       .data = nlohmann::json{{"task_id", task_id}},
                       .priority = model::event_priority::NORMAL,
                       .timestamp = std::nullopt,
                       .source = std::string("orchestrator"),
                       .id = std::nullopt});
  return true;
}

void Orchestrator::shutdown(const bool wait) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_) {
      return;
    }
    accepting_ = false;
  }

  pool_.shutdown(wait);

  std::lock_guard<std::mutex> lock(mutex_);
  executions_.clear();
  agents_.clear();
  std::cerr << "[orchestrator] shutdown complete\n";
}

std::size_t Orchestrator::dispatch_ready(const std::size_t max_tasks) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_) {
      return 0;
    }
  }

  std::size_t dispatched = 0;
  while (dispatched < max_tasks) {
    auto next = task_manager_.next_ready();
    if (!next) {
      std::cerr << "[orchestrator] " << core::describe(next.error()) << '\n';
      break;
    }
    if (!next.value().has_value()) {
      break;
    }

    const auto& task = *next.value();
    if (auto submitted = submit(task); !submitted) {
      std::cerr << "[orchestrator] dispatch of " << task.id << " failed: " << core::describe(submitted.error())
                << '\n';
      if (auto failed = task_manager_.update_state(task.id, model::task_state::FAILED,
                                                   core::describe(submitted.error()));
          !failed) {
        std::cerr << "[orchestrator] " << core::describe(failed.error()) << '\n';
      }
      // One failed hand-off per round; the retry waits for the next round.
      break;
    }
    ++dispatched;
  }
  return dispatched;
}

std::size_t Orchestrator::idle_workers() const { return pool_.idle(); }

std::vector<AgentStatus> Orchestrator::agent_status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AgentStatus> out;
  out.reserve(agents_.size());
  for (const auto& [agent_id, registration] : agents_) {
    out.push_back(AgentStatus{.agent_id = agent_id,
                              .timeout = registration.timeout,
                              .tasks_completed = registration.completed,
                              .tasks_failed = registration.failed,
                              .abandoned_calls = registration.abandoned_calls->load()});
  }
  return out;
}

core::Result<void> Orchestrator::dispatch(const model::task& task) { return submit(task); }

bool Orchestrator::reachable() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return accepting_ && !agents_.empty();
}

}  // namespace orchestra::orch

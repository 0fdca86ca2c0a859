#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "bus/event_bus.hpp"
#include "core/result.hpp"
#include "core/timestamp.hpp"
#include "model/task.hpp"
#include "orch/agent.hpp"
#include "orch/worker_pool.hpp"
#include "sched/dispatcher.hpp"
#include "tasks/task_manager.hpp"

namespace orchestra::orch {

inline constexpr std::size_t kDefaultWorkers = 5;

struct TaskContext {
  std::string task_id;
  std::string agent_id;
  int priority{model::kDefaultPriority};
  core::TimePoint submitted_at{};
  std::optional<core::TimePoint> start_time{};
  std::optional<core::TimePoint> end_time{};
};

enum class ExecutionStatus : std::uint8_t { NOT_FOUND, RUNNING, COMPLETED, FAILED };

const char* to_string(ExecutionStatus status) noexcept;

struct TaskStatus {
  ExecutionStatus status{ExecutionStatus::NOT_FOUND};
  std::optional<nlohmann::json> result{};
  std::optional<std::string> error{};
  std::optional<TaskContext> context{};
};

struct AgentStatus {
  std::string agent_id;
  std::optional<std::chrono::milliseconds> timeout{};
  std::size_t tasks_completed{0};
  std::size_t tasks_failed{0};
  // Timed-out calls whose agent has not returned yet.
  std::size_t abandoned_calls{0};
};

// Binds agents to task execution on a bounded worker pool. Each worker marks
// the task running, invokes the agent, feeds the outcome to the task manager
// and publishes task_executed.
class Orchestrator final : public sched::TaskDispatcher {
 public:
  Orchestrator(tasks::TaskManager& task_manager, bus::EventBus& event_bus, std::size_t workers = kDefaultWorkers);
  ~Orchestrator() override;

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // A timeout turns a slow agent call into a failure outcome; the call itself
  // is left to finish in the background and is counted in agent_status().
  void register_agent(const std::string& agent_id, std::shared_ptr<Agent> agent,
                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);
  void unregister_agent(const std::string& agent_id);

  core::Result<void> submit(const model::task& task);
  [[nodiscard]] TaskStatus status(const std::string& task_id) const;
  bool cancel(const std::string& task_id);
  void shutdown(bool wait = true);

  // Pulls up to `max_tasks` ready tasks from the task manager and submits
  // them. Returns how many were handed to workers.
  std::size_t dispatch_ready(std::size_t max_tasks);

  [[nodiscard]] std::size_t idle_workers() const;
  [[nodiscard]] std::vector<AgentStatus> agent_status() const;

  core::Result<void> dispatch(const model::task& task) override;
  [[nodiscard]] bool reachable() const override;

 private:
  struct Registration {
    std::shared_ptr<Agent> agent;
    std::optional<std::chrono::milliseconds> timeout;
    std::size_t completed{0};
    std::size_t failed{0};
    std::shared_ptr<std::atomic<std::size_t>> abandoned_calls;
  };

  struct Execution {
    TaskContext context;
    std::shared_ptr<Agent> agent;
    std::optional<std::chrono::milliseconds> timeout;
    std::shared_ptr<std::atomic<std::size_t>> abandoned_calls;
    bool needs_start{true};
    std::optional<nlohmann::json> result;
    std::optional<std::string> error;
    std::shared_ptr<WorkHandle> handle;
  };

  void run(const std::shared_ptr<Execution>& execution, const nlohmann::json& payload);
  void record_outcome(const std::string& agent_id, bool success);
  void publish(model::event event);

  tasks::TaskManager& task_manager_;
  bus::EventBus& event_bus_;

  mutable std::mutex mutex_;
  bool accepting_{true};
  std::unordered_map<std::string, Registration> agents_;
  std::unordered_map<std::string, std::shared_ptr<Execution>> executions_;

  // Last member: destroyed first, so workers never outlive the state above.
  WorkerPool pool_;
};

}  // namespace orchestra::orch

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>

#include "bus/event_bus.hpp"
#include "core/config.hpp"
#include "core/result.hpp"
#include "model/task.hpp"
#include "orch/orchestrator.hpp"
#include "sched/scheduler.hpp"
#include "sinks/event_log.hpp"
#include "store/task_store.hpp"
#include "tasks/task_manager.hpp"

namespace orchestra::core {

struct RuntimeStats {
  std::size_t ticks_executed{0};
  std::size_t tasks_dispatched{0};
  std::size_t offline_drained{0};
  std::size_t tasks_cleaned{0};
};

std::unique_ptr<store::TaskStore> make_task_store(const StoreConfig& config);

// Owns every component of the orchestration core and wires them together.
class Runtime {
 public:
  explicit Runtime(OrchestraConfig config = {});
  Runtime(OrchestraConfig config, std::unique_ptr<store::TaskStore> store);
  ~Runtime();

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  // Rebuilds task queues from the store and starts the background threads.
  Result<void> start();
  // Stops the scheduler, finishes in-flight work, then flushes queued events.
  void stop();

  // total_ticks == 0 runs until the process exits.
  RuntimeStats run_for_ticks(std::size_t total_ticks);

  [[nodiscard]] const OrchestraConfig& config() const noexcept { return config_; }
  store::TaskStore& task_store() noexcept { return *store_; }
  tasks::TaskManager& task_manager() noexcept { return task_manager_; }
  bus::EventBus& event_bus() noexcept { return event_bus_; }
  orch::Orchestrator& orchestrator() noexcept { return orchestrator_; }
  sched::Scheduler& scheduler() noexcept { return scheduler_; }

 private:
  void publish_transition(const model::task& task, std::optional<model::task_state> previous);
  void tick(RuntimeStats& stats);

  OrchestraConfig config_;
  std::unique_ptr<store::TaskStore> store_;
  bus::EventBus event_bus_;
  tasks::TaskManager task_manager_;
  orch::Orchestrator orchestrator_;
  sched::Scheduler scheduler_;
  std::shared_ptr<sinks::EventLogSink> event_log_{};

  bool started_{false};
  bool first_tick_{true};
  std::chrono::steady_clock::time_point next_wakeup_{};
  TimePoint next_cleanup_{};
};

}  // namespace orchestra::core

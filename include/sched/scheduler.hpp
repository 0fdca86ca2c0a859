#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "bus/event_bus.hpp"
#include "core/result.hpp"
#include "core/timestamp.hpp"
#include "model/schedule.hpp"
#include "sched/cron.hpp"
#include "sched/dispatcher.hpp"
#include "tasks/task_manager.hpp"

namespace orchestra::sched {

struct JobInfo {
  std::string job_id;
  std::string agent_id;
  int priority{model::kDefaultPriority};
  model::schedule_config config{};
  std::optional<core::TimePoint> next_fire{};
  std::optional<core::TimePoint> retry_at{};
  int retry_count{0};
  std::size_t fire_count{0};
  std::optional<std::string> last_error{};
};

struct OfflineFiring {
  std::string job_id;
  nlohmann::json payload;
  std::string agent_id;
  int priority{model::kDefaultPriority};
  core::TimePoint queued_at{};
};

// Turns schedule configs into task firings. Every firing materializes a task
// "<job_id>:<n>" through the task manager and hands it to the dispatcher.
//
// A firing that cannot be created or dispatched is retried after
// retry_delay while the job's retry counter is below max_retries; the counter
// starts over with each regular firing. While the dispatcher is unreachable
// firings are parked in an offline list for drain_offline().
class Scheduler {
 public:
  using NowFn = std::function<core::TimePoint()>;

  Scheduler(tasks::TaskManager& task_manager, bus::EventBus& event_bus, TaskDispatcher& dispatcher,
            NowFn now = [] { return core::Clock::now(); });
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  static core::Result<void> validate(const model::schedule_config& config);

  core::Result<void> schedule(const std::string& job_id, nlohmann::json payload, model::schedule_config config,
                              std::string agent_id, int priority = model::kDefaultPriority);
  core::Result<void> cancel(const std::string& job_id);
  [[nodiscard]] std::vector<JobInfo> list() const;

  // Performs every firing due at `now` on the calling thread. Returns the
  // number of firings attempted.
  std::size_t run_due(core::TimePoint now);

  // Re-attempts parked firings once the dispatcher is reachable again; the
  // ones that still fail stay parked. Returns the number dispatched.
  std::size_t drain_offline();
  [[nodiscard]] std::size_t offline_count() const;

  void start();
  void stop();

 private:
  struct Job {
    std::string job_id;
    nlohmann::json payload;
    std::string agent_id;
    int priority{model::kDefaultPriority};
    model::schedule_config config;
    std::optional<CronExpression> cron;
    std::optional<core::TimePoint> next_fire;
    std::optional<core::TimePoint> retry_at;
    int retry_count{0};
    std::size_t fire_count{0};
    std::optional<std::string> last_error;
  };

  struct Firing {
    std::string job_id;
    nlohmann::json payload;
    std::string agent_id;
    int priority{model::kDefaultPriority};
  };

  enum class Outcome : std::uint8_t { DISPATCHED, OFFLINE, FAILED };

  Outcome attempt(const Firing& firing, std::optional<core::Error>& error);
  void handle_failure(const Firing& firing, const core::Error& error, core::TimePoint now);
  void publish(model::event event);
  void prune_locked();
  [[nodiscard]] std::optional<core::TimePoint> earliest_trigger_locked() const;
  void timer_loop();

  static std::optional<core::TimePoint> first_fire(const Job& job, core::TimePoint now);
  static std::optional<core::TimePoint> following_fire(const Job& job, core::TimePoint fired_at,
                                                       core::TimePoint now);

  tasks::TaskManager& task_manager_;
  bus::EventBus& event_bus_;
  TaskDispatcher& dispatcher_;
  NowFn now_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<std::string, Job> jobs_;
  std::vector<OfflineFiring> offline_;
  bool stopping_{false};

  std::mutex run_mutex_;
  std::atomic<std::uint64_t> sequence_{0};
  std::thread timer_;
};

}  // namespace orchestra::sched

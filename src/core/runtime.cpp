#include "core/runtime.hpp"

#include <iostream>
#include <thread>
#include <utility>

#include "store/file_store.hpp"
#include "store/memory_store.hpp"
#include "store/redis_store.hpp"

namespace orchestra::core {

std::unique_ptr<store::TaskStore> make_task_store(const StoreConfig& config) {
  switch (config.backend) {
    case StoreBackend::MEMORY:
      return std::make_unique<store::MemoryTaskStore>();
    case StoreBackend::FILE:
      return std::make_unique<store::FileTaskStore>(config.directory);
    case StoreBackend::REDIS: {
      store::RedisStoreOptions options{};
      options.host = config.redis.host;
      options.port = config.redis.port;
      options.unix_socket = config.redis.unix_socket;
      options.password = config.redis.password;
      options.db = config.redis.db;
      options.key_prefix = config.redis.key_prefix;
      auto redis = std::make_unique<store::RedisTaskStore>(options);

      const std::string address =
          options.unix_socket.empty() ? options.host + ':' + std::to_string(options.port) : "unix://" + options.unix_socket;
      if (redis->check_connectivity()) {
        std::cerr << "[runtime] redis connectivity confirmed at " << address << '\n';
      } else {
        std::cerr << "[runtime] redis connectivity check failed at " << address << '\n';
      }
      return redis;
    }
  }
  return std::make_unique<store::MemoryTaskStore>();
}

Runtime::Runtime(OrchestraConfig config) : Runtime(config, make_task_store(config.store)) {}

Runtime::Runtime(OrchestraConfig config, std::unique_ptr<store::TaskStore> store)
    : config_(std::move(config)),
      store_(std::move(store)),
      event_bus_(config_.event_queue_capacity),
      task_manager_(*store_, config_.max_retries),
      orchestrator_(task_manager_, event_bus_, config_.workers),
      scheduler_(task_manager_, event_bus_, orchestrator_) {
  task_manager_.set_transition_listener(
      [this](const model::task& task, const std::optional<model::task_state> previous) {
        publish_transition(task, previous);
      });

  if (config_.stdout_events) {
    event_log_ = std::make_shared<sinks::EventLogSink>();
    sinks::attach_event_log(event_bus_, event_log_);
  }
}

Runtime::~Runtime() { stop(); }

Result<void> Runtime::start() {
  if (started_) {
    return ok();
  }

  auto loaded = task_manager_.load();
  if (!loaded) {
    std::cerr << "[runtime] task recovery failed: " << describe(loaded.error()) << '\n';
    return loaded.error();
  }

  event_bus_.start();
  scheduler_.start();
  next_cleanup_ = Clock::now() + config_.cleanup_interval;
  started_ = true;
  std::cerr << "[runtime] started with " << config_.workers << " workers, store=" << to_string(config_.store.backend)
            << '\n';
  return ok();
}

void Runtime::stop() {
  if (!started_) {
    return;
  }
  started_ = false;

  scheduler_.stop();
  orchestrator_.shutdown(true);
  event_bus_.stop();
  const auto flushed = event_bus_.drain();
  std::cerr << "[runtime] stopped; flushed " << flushed << " events\n";
}

RuntimeStats Runtime::run_for_ticks(const std::size_t total_ticks) {
  RuntimeStats stats{};

  if (first_tick_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
  }

  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    tick(stats);
    ++stats.ticks_executed;

    next_wakeup_ += config_.tick_interval;
    std::this_thread::sleep_until(next_wakeup_);
  }

  return stats;
}

void Runtime::tick(RuntimeStats& stats) {
  stats.tasks_dispatched += orchestrator_.dispatch_ready(orchestrator_.idle_workers());

  if (scheduler_.offline_count() > 0) {
    stats.offline_drained += scheduler_.drain_offline();
  }

  const auto now = Clock::now();
  if (now >= next_cleanup_) {
    next_cleanup_ = now + config_.cleanup_interval;
    auto cleaned = task_manager_.cleanup(now - config_.cleanup_max_age);
    if (!cleaned) {
      std::cerr << "[runtime] cleanup failed: " << describe(cleaned.error()) << '\n';
    } else if (cleaned.value() > 0) {
      std::cerr << "[runtime] cleaned up " << cleaned.value() << " finished tasks\n";
      stats.tasks_cleaned += cleaned.value();
    }
  }
}

void Runtime::publish_transition(const model::task& task, const std::optional<model::task_state> previous) {
  nlohmann::json data{{"task_id", task.id},
                      {"agent_id", task.agent_id},
                      {"state", model::to_string(task.state)},
                      {"retries", task.metadata.retries}};
  if (previous.has_value()) {
    data["previous_state"] = model::to_string(*previous);
  }
  if (task.metadata.last_error.has_value()) {
    data["last_error"] = *task.metadata.last_error;
  }

  auto published = event_bus_.publish(model::event{
      .type = previous.has_value() ? model::event_types::kTaskStateChanged : model::event_types::kTaskCreated,
      .data = std::move(data),
      .priority = model::event_priority::LOW,
      .timestamp = std::nullopt,
      .source = std::string("task_manager"),
      .id = std::nullopt});
  if (!published) {
    std::cerr << "[runtime] " << describe(published.error()) << '\n';
  }
}

}  // namespace orchestra::core

#include "sched/scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

namespace orchestra::sched {
namespace {

constexpr std::chrono::seconds kMaxIdleWait{1};

core::Error invalid(const std::string& why) {
  return core::make_error(core::ErrorKind::invalid_schedule, why);
}

nlohmann::json time_or_null(const std::optional<core::TimePoint>& time) {
  if (!time.has_value()) {
    return nullptr;
  }
  return core::to_unix_ms(*time);
}

// Smallest start + k * interval that is >= now.
core::TimePoint align_interval(const core::TimePoint start, const std::chrono::milliseconds interval,
                               const core::TimePoint now) {
  if (now <= start) {
    return start;
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - start);
  const auto steps = (elapsed.count() + interval.count() - 1) / interval.count();
  return start + interval * steps;
}

}  // namespace

Scheduler::Scheduler(tasks::TaskManager& task_manager, bus::EventBus& event_bus, TaskDispatcher& dispatcher,
                     NowFn now)
    : task_manager_(task_manager), event_bus_(event_bus), dispatcher_(dispatcher), now_(std::move(now)) {}

Scheduler::~Scheduler() { stop(); }

core::Result<void> Scheduler::validate(const model::schedule_config& config) {
  switch (config.kind) {
    case model::schedule_kind::ONE_TIME:
      if (!config.start_at.has_value()) {
        return invalid("start_at required for one_time schedule");
      }
      if (config.interval.has_value() || config.cron_expression.has_value()) {
        return invalid("one_time schedule takes neither interval nor cron_expression");
      }
      break;
    case model::schedule_kind::RECURRING:
      if (!config.interval.has_value()) {
        return invalid("interval required for recurring schedule");
      }
      if (config.interval->count() <= 0) {
        return invalid("interval must be positive");
      }
      if (config.cron_expression.has_value()) {
        return invalid("recurring schedule takes no cron_expression");
      }
      break;
    case model::schedule_kind::CRON: {
      if (!config.cron_expression.has_value()) {
        return invalid("cron_expression required for cron schedule");
      }
      if (config.interval.has_value()) {
        return invalid("cron schedule takes no interval");
      }
      auto parsed = CronExpression::parse(*config.cron_expression);
      if (!parsed) {
        return parsed.error();
      }
      break;
    }
  }

  if (config.start_at.has_value() && config.end_at.has_value() && *config.end_at < *config.start_at) {
    return invalid("end_at precedes start_at");
  }
  if (config.max_retries < 0) {
    return invalid("max_retries must not be negative");
  }
  if (config.retry_delay.count() < 0) {
    return invalid("retry_delay must not be negative");
  }
  return core::ok();
}

std::optional<core::TimePoint> Scheduler::first_fire(const Job& job, const core::TimePoint now) {
  const auto& config = job.config;
  std::optional<core::TimePoint> first;
  switch (config.kind) {
    case model::schedule_kind::ONE_TIME:
      return config.start_at;
    case model::schedule_kind::RECURRING:
      first = config.start_at.has_value() ? align_interval(*config.start_at, *config.interval, now)
                                          : now + *config.interval;
      break;
    case model::schedule_kind::CRON:
      first = job.cron->next_after(config.start_at.has_value() ? std::max(now, *config.start_at) : now);
      break;
  }

  if (first.has_value() && config.end_at.has_value() && *first > *config.end_at) {
    return std::nullopt;
  }
  return first;
}

std::optional<core::TimePoint> Scheduler::following_fire(const Job& job, const core::TimePoint fired_at,
                                                         const core::TimePoint now) {
  const auto& config = job.config;
  std::optional<core::TimePoint> next;
  switch (config.kind) {
    case model::schedule_kind::ONE_TIME:
      return std::nullopt;
    case model::schedule_kind::RECURRING:
      // Missed intervals are skipped, not replayed.
      next = align_interval(fired_at + *config.interval, *config.interval, now);
      break;
    case model::schedule_kind::CRON:
      next = job.cron->next_after(std::max(fired_at + std::chrono::minutes(1), now));
      break;
  }

  if (next.has_value() && config.end_at.has_value() && *next > *config.end_at) {
    return std::nullopt;
  }
  return next;
}

core::Result<void> Scheduler::schedule(const std::string& job_id, nlohmann::json payload,
                                       model::schedule_config config, std::string agent_id, const int priority) {
  if (auto valid = validate(config); !valid) {
    std::cerr << "[scheduler] rejected job " << job_id << ": " << valid.error().message << '\n';
    return valid;
  }

  Job job{};
  job.job_id = job_id;
  job.payload = std::move(payload);
  job.agent_id = std::move(agent_id);
  job.priority = priority;
  job.config = std::move(config);
  if (job.config.kind == model::schedule_kind::CRON) {
    auto parsed = CronExpression::parse(*job.config.cron_expression);
    if (!parsed) {
      return parsed.error();
    }
    job.cron = std::move(parsed).value();
  }

  std::optional<core::TimePoint> next_fire;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.find(job_id) != jobs_.end()) {
      return core::make_error(core::ErrorKind::duplicate_schedule, "job " + job_id + " already scheduled");
    }
    job.next_fire = first_fire(job, now_());
    next_fire = job.next_fire;
    jobs_.emplace(job_id, job);
  }
  cv_.notify_all();

  std::cerr << "[scheduler] job " << job_id << " scheduled (" << model::to_string(job.config.kind);
  if (job.cron.has_value()) {
    std::cerr << " '" << job.cron->text() << "'";
  }
  std::cerr << ")\n";
  publish(model::event{.type = model::event_types::kTaskScheduled,
                       .data = nlohmann::json{{"task_id", job_id},
                                              {"schedule_type", model::to_string(job.config.kind)},
                                              {"agent_id", job.agent_id},
                                              {"next_fire", time_or_null(next_fire)}},
                       .priority = model::event_priority::NORMAL,
                       .timestamp = std::nullopt,
                       .source = std::string("scheduler"),
                       .id = std::nullopt});
  return core::ok();
}

core::Result<void> Scheduler::cancel(const std::string& job_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.erase(job_id) == 0) {
      return core::make_error(core::ErrorKind::schedule_not_found, "job " + job_id + " not scheduled");
    }
  }
  cv_.notify_all();
  std::cerr << "[scheduler] job " << job_id << " cancelled\n";
  return core::ok();
}

std::vector<JobInfo> Scheduler::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<JobInfo> out;
  out.reserve(jobs_.size());
  for (const auto& [job_id, job] : jobs_) {
    out.push_back(JobInfo{.job_id = job_id,
                          .agent_id = job.agent_id,
                          .priority = job.priority,
                          .config = job.config,
                          .next_fire = job.next_fire,
                          .retry_at = job.retry_at,
                          .retry_count = job.retry_count,
                          .fire_count = job.fire_count,
                          .last_error = job.last_error});
  }
  return out;
}

std::size_t Scheduler::run_due(const core::TimePoint now) {
  std::lock_guard<std::mutex> run_lock(run_mutex_);

  std::vector<Firing> due;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [job_id, job] : jobs_) {
      bool fire = false;
      if (job.retry_at.has_value() && *job.retry_at <= now) {
        job.retry_at.reset();
        fire = true;
      }
      if (job.next_fire.has_value() && *job.next_fire <= now) {
        const auto fired_at = *job.next_fire;
        job.next_fire = following_fire(job, fired_at, now);
        job.retry_count = 0;
        ++job.fire_count;
        fire = true;
      }
      if (fire) {
        due.push_back(Firing{job.job_id, job.payload, job.agent_id, job.priority});
      }
    }
  }

  for (const auto& firing : due) {
    std::optional<core::Error> error;
    switch (attempt(firing, error)) {
      case Outcome::DISPATCHED:
      case Outcome::OFFLINE:
        break;
      case Outcome::FAILED:
        handle_failure(firing, *error, now);
        break;
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    prune_locked();
  }
  return due.size();
}

Scheduler::Outcome Scheduler::attempt(const Firing& firing, std::optional<core::Error>& error) {
  if (!dispatcher_.reachable()) {
    std::lock_guard<std::mutex> lock(mutex_);
    offline_.push_back(OfflineFiring{firing.job_id, firing.payload, firing.agent_id, firing.priority, now_()});
    std::cerr << "[scheduler] job " << firing.job_id << " queued for offline execution\n";
    return Outcome::OFFLINE;
  }

  const std::string task_id = firing.job_id + ":" + std::to_string(++sequence_);
  auto created = task_manager_.create(task_id, firing.payload, firing.agent_id, firing.priority);
  if (!created) {
    error = created.error();
    return Outcome::FAILED;
  }

  if (auto dispatched = dispatcher_.dispatch(created.value()); !dispatched) {
    error = dispatched.error();
    if (auto cancelled = task_manager_.cancel(task_id); !cancelled) {
      std::cerr << "[scheduler] " << core::describe(cancelled.error()) << '\n';
    }
    return Outcome::FAILED;
  }

  publish(model::event{.type = model::event_types::kTaskDispatched,
                       .data = nlohmann::json{{"job_id", firing.job_id},
                                              {"agent_id", firing.agent_id},
                                              {"task_id", task_id}},
                       .priority = model::event_priority::NORMAL,
                       .timestamp = std::nullopt,
                       .source = std::string("scheduler"),
                       .id = std::nullopt});
  return Outcome::DISPATCHED;
}

void Scheduler::handle_failure(const Firing& firing, const core::Error& error, const core::TimePoint now) {
  bool retrying = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = jobs_.find(firing.job_id);
    if (it != jobs_.end()) {
      auto& job = it->second;
      job.last_error = core::describe(error);
      if (job.config.retry_on_failure && job.retry_count < job.config.max_retries) {
        ++job.retry_count;
        job.retry_at = now + job.config.retry_delay;
        retrying = true;
        std::cerr << "[scheduler] scheduled retry " << job.retry_count << " for job " << firing.job_id << '\n';
      }
    }
  }

  if (retrying) {
    cv_.notify_all();
    return;
  }

  std::cerr << "[scheduler] job " << firing.job_id << " firing failed: " << core::describe(error) << '\n';
  // The firing never reached an agent, so no execution outcome will follow.
  publish(model::event{.type = model::event_types::kTaskExecuted,
                       .data = nlohmann::json{{"job_id", firing.job_id},
                                              {"agent_id", firing.agent_id},
                                              {"success", false},
                                              {"error", core::describe(error)}},
                       .priority = model::event_priority::HIGH,
                       .timestamp = std::nullopt,
                       .source = std::string("scheduler"),
                       .id = std::nullopt});
}

void Scheduler::publish(model::event event) {
  if (auto published = event_bus_.publish(std::move(event)); !published) {
    std::cerr << "[scheduler] " << core::describe(published.error()) << '\n';
  }
}

void Scheduler::prune_locked() {
  for (auto it = jobs_.begin(); it != jobs_.end();) {
    if (!it->second.next_fire.has_value() && !it->second.retry_at.has_value()) {
      std::cerr << "[scheduler] job " << it->first << " has no further triggers\n";
      it = jobs_.erase(it);
    } else {
      ++it;
    }
  }
}

std::size_t Scheduler::drain_offline() {
  if (!dispatcher_.reachable()) {
    return 0;
  }

  std::lock_guard<std::mutex> run_lock(run_mutex_);
  std::vector<OfflineFiring> parked;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    parked.swap(offline_);
  }

  std::size_t dispatched = 0;
  std::vector<OfflineFiring> still_failing;
  for (auto& entry : parked) {
    std::optional<core::Error> error;
    const Firing firing{entry.job_id, entry.payload, entry.agent_id, entry.priority};
    switch (attempt(firing, error)) {
      case Outcome::DISPATCHED:
        ++dispatched;
        break;
      case Outcome::OFFLINE:
        break;
      case Outcome::FAILED:
        std::cerr << "[scheduler] offline firing of " << entry.job_id << " failed: " << core::describe(*error)
                  << '\n';
        still_failing.push_back(std::move(entry));
        break;
    }
  }

  if (!still_failing.empty()) {
    std::lock_guard<std::mutex> lock(mutex_);
    offline_.insert(offline_.end(), std::make_move_iterator(still_failing.begin()),
                    std::make_move_iterator(still_failing.end()));
  }
  if (dispatched > 0) {
    std::cerr << "[scheduler] drained " << dispatched << " offline firings\n";
  }
  return dispatched;
}

std::size_t Scheduler::offline_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return offline_.size();
}

std::optional<core::TimePoint> Scheduler::earliest_trigger_locked() const {
  std::optional<core::TimePoint> earliest;
  for (const auto& [job_id, job] : jobs_) {
    for (const auto& trigger : {job.next_fire, job.retry_at}) {
      if (trigger.has_value() && (!earliest.has_value() || *trigger < *earliest)) {
        earliest = trigger;
      }
    }
  }
  return earliest;
}

void Scheduler::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (timer_.joinable()) {
    return;
  }
  stopping_ = false;
  timer_ = std::thread([this]() { timer_loop(); });
  std::cerr << "[scheduler] started\n";
}

void Scheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!timer_.joinable()) {
      return;
    }
    stopping_ = true;
  }
  cv_.notify_all();
  timer_.join();
  std::cerr << "[scheduler] stopped\n";
}

void Scheduler::timer_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    auto wait = std::chrono::duration_cast<core::Clock::duration>(kMaxIdleWait);
    if (const auto earliest = earliest_trigger_locked(); earliest.has_value()) {
      wait = std::clamp(*earliest - now_(), core::Clock::duration::zero(), wait);
    }
    if (wait > core::Clock::duration::zero()) {
      cv_.wait_for(lock, wait);
      continue;
    }

    lock.unlock();
    run_due(now_());
    lock.lock();
  }
}

}  // namespace orchestra::sched

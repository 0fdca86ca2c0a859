#include <atomic>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "bus/event_bus.hpp"
#include "core/result.hpp"
#include "core/timestamp.hpp"
#include "model/event.hpp"
#include "model/schedule.hpp"
#include "model/task.hpp"
#include "sched/cron.hpp"
#include "sched/dispatcher.hpp"
#include "sched/scheduler.hpp"
#include "store/memory_store.hpp"
#include "tasks/task_manager.hpp"

using namespace std::chrono_literals;
using orchestra::bus::EventBus;
using orchestra::core::ErrorKind;
using orchestra::core::Result;
using orchestra::core::TimePoint;
using orchestra::model::schedule_config;
using orchestra::model::schedule_kind;
using orchestra::model::task;
using orchestra::model::task_state;
using orchestra::sched::CronExpression;
using orchestra::sched::Scheduler;
using orchestra::sched::TaskDispatcher;
using orchestra::store::MemoryTaskStore;
using orchestra::tasks::TaskManager;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

TimePoint utc(const std::chrono::year_month_day date, const std::chrono::minutes time_of_day = 0min) {
  return std::chrono::sys_days{date} + time_of_day;
}

class FakeDispatcher final : public TaskDispatcher {
 public:
  Result<void> dispatch(const task& value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing) {
      return orchestra::core::make_error(ErrorKind::execution_failed, "agent refused " + value.id);
    }
    dispatched_.push_back(value);
    return orchestra::core::ok();
  }

  bool reachable() const override { return online.load(); }

  std::vector<task> dispatched() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dispatched_;
  }

  std::atomic<bool> online{true};
  std::atomic<bool> failing{false};

 private:
  mutable std::mutex mutex_;
  std::vector<task> dispatched_;
};

// Owns the collaborators of a scheduler running on a hand-set clock.
struct Harness {
  Harness() : tasks(store), scheduler(tasks, bus, dispatcher, [this] { return now; }) {}

  // Delivers every queued event and returns those of the given types in order.
  std::vector<orchestra::model::event> drain(std::initializer_list<const char*> types) {
    std::vector<orchestra::model::event> seen;
    auto handler = orchestra::bus::make_handler(
        [&seen](const orchestra::model::event& event) { seen.push_back(event); });
    for (const char* type : types) {
      bus.subscribe(type, handler);
    }
    bus.drain();
    for (const char* type : types) {
      bus.unsubscribe(type, handler);
    }
    return seen;
  }

  std::vector<orchestra::model::event> drain_executed() { return drain({orchestra::model::event_types::kTaskExecuted}); }

  TimePoint now{utc(std::chrono::year{2024} / std::chrono::March / 4, 9h)};
  MemoryTaskStore store;
  TaskManager tasks;
  EventBus bus;
  FakeDispatcher dispatcher;
  Scheduler scheduler;
};

schedule_config one_time_at(const TimePoint when) {
  schedule_config config{};
  config.kind = schedule_kind::ONE_TIME;
  config.start_at = when;
  return config;
}

int test_cron_parse_accepts_and_rejects() {
  for (const char* good : {"* * * * *", "*/15 9-17 * * mon-fri", "0 0 1,15 * *", "30 4 * jan,JUL 7", "5/10 * * * *",
                           "0/60 * * * *"}) {
    if (!CronExpression::parse(good)) {
      return fail("test_cron_parse_accepts_and_rejects", good);
    }
  }
  for (const char* bad : {"* * * *", "60 * * * *", "* 24 * * *", "* * 0 * *", "* * * 13 *", "*/0 * * * *",
                          "5-1 * * * *", "* * * * funday", "1,,2 * * * *",
                          "59/2147483647 * * * *", "* * */32 * *", "* * * * */9"}) {
    const auto parsed = CronExpression::parse(bad);
    if (parsed || parsed.kind() != ErrorKind::invalid_schedule) {
      return fail("test_cron_parse_accepts_and_rejects", bad);
    }
  }
  return 0;
}

int test_cron_next_after() {
  using namespace std::chrono;
  const auto every_minute = CronExpression::parse("*/1 * * * *");
  if (!every_minute) {
    return fail("test_cron_next_after", "every-minute expression should parse");
  }
  const auto from = utc(year{2024} / March / 4, 12h) + 30s;
  const auto next = every_minute.value().next_after(from);
  if (!next || *next <= from || *next - from > 60s) {
    return fail("test_cron_next_after", "every-minute schedule should fire within 60s");
  }
  const auto on_boundary = utc(year{2024} / March / 4, 12h);
  if (every_minute.value().next_after(on_boundary) != on_boundary) {
    return fail("test_cron_next_after", "a matching whole minute should be returned as is");
  }

  const auto monthly = CronExpression::parse("30 14 1 * *");
  if (!monthly || monthly.value().next_after(utc(year{2024} / January / 15)) != utc(year{2024} / February / 1, 14h + 30min)) {
    return fail("test_cron_next_after", "monthly expression should land on the first of next month");
  }

  // 2024-01-01 is a Monday.
  const auto sunday = CronExpression::parse("0 0 * * 7");
  if (!sunday || sunday.value().next_after(utc(year{2024} / January / 1)) != utc(year{2024} / January / 7)) {
    return fail("test_cron_next_after", "7 should mean Sunday");
  }

  const auto leap = CronExpression::parse("0 0 29 feb *");
  if (!leap || leap.value().next_after(utc(year{2025} / January / 1)) != utc(year{2028} / February / 29)) {
    return fail("test_cron_next_after", "leap day should be found years ahead");
  }

  const auto business = CronExpression::parse("0 9 * * mon-fri");
  const auto saturday_noon = utc(year{2024} / March / 9, 12h);
  if (!business || business.value().next_after(saturday_noon) != utc(year{2024} / March / 11, 9h)) {
    return fail("test_cron_next_after", "weekday expression should skip the weekend");
  }
  if (!business.value().matches(utc(year{2024} / March / 11, 9h) + 20s)) {
    return fail("test_cron_next_after", "matches should ignore seconds");
  }

  const auto impossible = CronExpression::parse("0 0 31 feb *");
  if (!impossible || impossible.value().next_after(saturday_noon).has_value()) {
    return fail("test_cron_next_after", "an impossible date should never fire");
  }
  return 0;
}

int test_validate_rejects_inconsistent_configs() {
  schedule_config no_start{};
  no_start.kind = schedule_kind::ONE_TIME;

  schedule_config zero_interval{};
  zero_interval.kind = schedule_kind::RECURRING;
  zero_interval.interval = 0ms;

  schedule_config no_interval{};
  no_interval.kind = schedule_kind::RECURRING;

  schedule_config bad_cron{};
  bad_cron.kind = schedule_kind::CRON;
  bad_cron.cron_expression = "61 * * * *";

  schedule_config backwards{};
  backwards.kind = schedule_kind::RECURRING;
  backwards.interval = 1min;
  backwards.start_at = orchestra::core::from_unix_ms(2000);
  backwards.end_at = orchestra::core::from_unix_ms(1000);

  schedule_config negative_retries = one_time_at(orchestra::core::from_unix_ms(0));
  negative_retries.max_retries = -1;

  for (const auto& config : {no_start, zero_interval, no_interval, bad_cron, backwards, negative_retries}) {
    const auto valid = Scheduler::validate(config);
    if (valid || valid.kind() != ErrorKind::invalid_schedule) {
      return fail("test_validate_rejects_inconsistent_configs", "config should be InvalidScheduleError");
    }
  }

  Harness h;
  const auto rejected = h.scheduler.schedule("bad", nullptr, no_start, "echo");
  if (rejected || !h.scheduler.list().empty()) {
    return fail("test_validate_rejects_inconsistent_configs", "rejected job must not be registered");
  }
  return 0;
}

int test_duplicate_and_missing_jobs() {
  Harness h;
  const auto config = one_time_at(h.now + 1h);
  if (!h.scheduler.schedule("nightly", {{"x", 1}}, config, "echo")) {
    return fail("test_duplicate_and_missing_jobs", "first schedule should succeed");
  }
  const auto duplicate = h.scheduler.schedule("nightly", {{"x", 2}}, config, "echo");
  if (duplicate || duplicate.kind() != ErrorKind::duplicate_schedule) {
    return fail("test_duplicate_and_missing_jobs", "second schedule should be DuplicateScheduleError");
  }

  const auto missing = h.scheduler.cancel("weekly");
  if (missing || missing.kind() != ErrorKind::schedule_not_found) {
    return fail("test_duplicate_and_missing_jobs", "unknown job should be ScheduleNotFoundError");
  }
  if (!h.scheduler.cancel("nightly") || !h.scheduler.list().empty()) {
    return fail("test_duplicate_and_missing_jobs", "cancel should remove the job");
  }

  h.now += 2h;
  if (h.scheduler.run_due(h.now) != 0 || !h.dispatcher.dispatched().empty()) {
    return fail("test_duplicate_and_missing_jobs", "cancelled job must not fire");
  }
  return 0;
}

int test_schedule_publishes_task_scheduled() {
  Harness h;
  std::vector<orchestra::model::event> seen;
  h.bus.subscribe(orchestra::model::event_types::kTaskScheduled,
                  orchestra::bus::make_handler([&seen](const orchestra::model::event& event) { seen.push_back(event); }));

  schedule_config config{};
  config.kind = schedule_kind::CRON;
  config.cron_expression = "0 * * * *";
  if (!h.scheduler.schedule("hourly", nullptr, config, "echo")) {
    return fail("test_schedule_publishes_task_scheduled", "cron job should be accepted");
  }
  h.bus.drain();

  if (seen.size() != 1 || seen[0].data.value("schedule_type", "") != "cron" ||
      seen[0].data.value("task_id", "") != "hourly" || !seen[0].timestamp.has_value()) {
    return fail("test_schedule_publishes_task_scheduled", "task_scheduled event should describe the job");
  }
  if (seen[0].data["next_fire"].get<std::int64_t>() != orchestra::core::to_unix_ms(h.now)) {
    return fail("test_schedule_publishes_task_scheduled", "a matching whole minute should be the first firing");
  }
  return 0;
}

int test_one_time_fires_once() {
  Harness h;
  if (!h.scheduler.schedule("report", {{"pages", 3}}, one_time_at(h.now + 10s), "echo", 2)) {
    return fail("test_one_time_fires_once", "schedule should succeed");
  }

  if (h.scheduler.run_due(h.now) != 0) {
    return fail("test_one_time_fires_once", "job must not fire before start_at");
  }
  h.now += 10s;
  if (h.scheduler.run_due(h.now) != 1) {
    return fail("test_one_time_fires_once", "job should fire at start_at");
  }
  h.now += 1h;
  if (h.scheduler.run_due(h.now) != 0 || !h.scheduler.list().empty()) {
    return fail("test_one_time_fires_once", "one-time job should be gone after firing");
  }

  const auto dispatched = h.dispatcher.dispatched();
  if (dispatched.size() != 1 || dispatched[0].id != "report:1" || dispatched[0].priority != 2 ||
      dispatched[0].payload != nlohmann::json{{"pages", 3}}) {
    return fail("test_one_time_fires_once", "firing should dispatch the job's task");
  }
  const auto stored = h.tasks.get("report:1");
  if (!stored || stored->agent_id != "echo" || stored->state != task_state::PENDING) {
    return fail("test_one_time_fires_once", "firing should create the task through the manager");
  }

  // The hand-off is reported as task_dispatched; task_executed is left to
  // whoever runs the task and knows its outcome.
  const auto events =
      h.drain({orchestra::model::event_types::kTaskDispatched, orchestra::model::event_types::kTaskExecuted});
  if (events.size() != 1 || events[0].type != orchestra::model::event_types::kTaskDispatched ||
      events[0].data.value("task_id", "") != "report:1" || events[0].data.value("job_id", "") != "report" ||
      events[0].source != "scheduler" || events[0].data.contains("success")) {
    return fail("test_one_time_fires_once", "a dispatched firing should publish task_dispatched only");
  }
  return 0;
}

int test_recurring_skips_missed_intervals() {
  Harness h;
  const auto start = h.now;
  schedule_config config{};
  config.kind = schedule_kind::RECURRING;
  config.interval = 60s;
  config.start_at = start;
  config.end_at = start + 10min;
  if (!h.scheduler.schedule("poll", nullptr, config, "echo")) {
    return fail("test_recurring_skips_missed_intervals", "schedule should succeed");
  }

  if (h.scheduler.run_due(start) != 1) {
    return fail("test_recurring_skips_missed_intervals", "first firing is at start_at");
  }
  auto jobs = h.scheduler.list();
  if (jobs.size() != 1 || jobs[0].next_fire != start + 60s) {
    return fail("test_recurring_skips_missed_intervals", "next firing should be one interval later");
  }

  if (h.scheduler.run_due(start + 200s) != 1) {
    return fail("test_recurring_skips_missed_intervals", "late run should fire once");
  }
  jobs = h.scheduler.list();
  if (jobs.size() != 1 || jobs[0].next_fire != start + 240s || jobs[0].fire_count != 2) {
    return fail("test_recurring_skips_missed_intervals", "missed intervals should be skipped");
  }

  if (h.scheduler.run_due(start + 10min + 30s) != 1 || !h.scheduler.list().empty()) {
    return fail("test_recurring_skips_missed_intervals", "job should end once end_at is passed");
  }
  if (h.dispatcher.dispatched().size() != 3) {
    return fail("test_recurring_skips_missed_intervals", "three firings expected");
  }
  return 0;
}

int test_failed_firing_retries_then_gives_up() {
  Harness h;
  auto config = one_time_at(h.now);
  config.max_retries = 2;
  config.retry_delay = 5s;
  if (!h.scheduler.schedule("sync", nullptr, config, "echo")) {
    return fail("test_failed_firing_retries_then_gives_up", "schedule should succeed");
  }

  h.dispatcher.failing = true;
  (void)h.scheduler.run_due(h.now);
  auto jobs = h.scheduler.list();
  if (jobs.size() != 1 || jobs[0].retry_count != 1 || jobs[0].retry_at != h.now + 5s || !jobs[0].last_error) {
    return fail("test_failed_firing_retries_then_gives_up", "first failure should arm a retry");
  }
  const auto abandoned = h.tasks.get("sync:1");
  if (!abandoned || abandoned->state != task_state::CANCELLED) {
    return fail("test_failed_firing_retries_then_gives_up", "undispatched task should be cancelled");
  }
  if (!h.drain_executed().empty()) {
    return fail("test_failed_firing_retries_then_gives_up", "armed retries publish nothing");
  }

  if (h.scheduler.run_due(h.now + 4s) != 0) {
    return fail("test_failed_firing_retries_then_gives_up", "retry must wait for retry_delay");
  }
  h.now += 5s;
  (void)h.scheduler.run_due(h.now);
  jobs = h.scheduler.list();
  if (jobs.size() != 1 || jobs[0].retry_count != 2) {
    return fail("test_failed_firing_retries_then_gives_up", "second failure should arm another retry");
  }

  h.now += 5s;
  (void)h.scheduler.run_due(h.now);
  if (!h.scheduler.list().empty()) {
    return fail("test_failed_firing_retries_then_gives_up", "job should be dropped after max_retries");
  }
  const auto executed = h.drain_executed();
  if (executed.size() != 1 || executed[0].data.value("success", true)) {
    return fail("test_failed_firing_retries_then_gives_up", "giving up should publish one failed task_executed");
  }
  return 0;
}

int test_retry_recovers_when_dispatch_succeeds() {
  Harness h;
  auto config = one_time_at(h.now);
  config.retry_delay = 1min;
  if (!h.scheduler.schedule("sync", nullptr, config, "echo")) {
    return fail("test_retry_recovers_when_dispatch_succeeds", "schedule should succeed");
  }

  h.dispatcher.failing = true;
  (void)h.scheduler.run_due(h.now);
  h.dispatcher.failing = false;
  h.now += 1min;
  (void)h.scheduler.run_due(h.now);

  const auto dispatched = h.dispatcher.dispatched();
  if (dispatched.size() != 1 || dispatched[0].id != "sync:2" || !h.scheduler.list().empty()) {
    return fail("test_retry_recovers_when_dispatch_succeeds", "retry should dispatch a fresh task");
  }
  const auto events =
      h.drain({orchestra::model::event_types::kTaskDispatched, orchestra::model::event_types::kTaskExecuted});
  if (events.size() != 1 || events[0].type != orchestra::model::event_types::kTaskDispatched ||
      events[0].data.value("task_id", "") != "sync:2") {
    return fail("test_retry_recovers_when_dispatch_succeeds", "recovered firing should report the hand-off");
  }
  return 0;
}

int test_no_retry_when_disabled() {
  Harness h;
  auto config = one_time_at(h.now);
  config.retry_on_failure = false;
  if (!h.scheduler.schedule("once", nullptr, config, "echo")) {
    return fail("test_no_retry_when_disabled", "schedule should succeed");
  }

  h.dispatcher.failing = true;
  (void)h.scheduler.run_due(h.now);
  if (!h.scheduler.list().empty() || h.drain_executed().size() != 1) {
    return fail("test_no_retry_when_disabled", "failure should be final without retries");
  }
  return 0;
}

int test_offline_firings_wait_for_dispatcher() {
  Harness h;
  if (!h.scheduler.schedule("backup", {{"target", "s3"}}, one_time_at(h.now), "echo")) {
    return fail("test_offline_firings_wait_for_dispatcher", "schedule should succeed");
  }

  h.dispatcher.online = false;
  (void)h.scheduler.run_due(h.now);
  if (h.scheduler.offline_count() != 1 || !h.tasks.list().empty()) {
    return fail("test_offline_firings_wait_for_dispatcher", "firing should be parked without creating a task");
  }
  if (h.scheduler.drain_offline() != 0 || h.scheduler.offline_count() != 1) {
    return fail("test_offline_firings_wait_for_dispatcher", "draining while offline should do nothing");
  }

  h.dispatcher.online = true;
  if (h.scheduler.drain_offline() != 1 || h.scheduler.offline_count() != 0) {
    return fail("test_offline_firings_wait_for_dispatcher", "parked firing should dispatch once online");
  }
  const auto dispatched = h.dispatcher.dispatched();
  if (dispatched.size() != 1 || dispatched[0].payload.value("target", "") != "s3") {
    return fail("test_offline_firings_wait_for_dispatcher", "parked payload should be dispatched");
  }
  return 0;
}

int test_offline_failures_stay_parked() {
  Harness h;
  if (!h.scheduler.schedule("backup", nullptr, one_time_at(h.now), "echo")) {
    return fail("test_offline_failures_stay_parked", "schedule should succeed");
  }

  h.dispatcher.online = false;
  (void)h.scheduler.run_due(h.now);
  h.dispatcher.online = true;
  h.dispatcher.failing = true;
  if (h.scheduler.drain_offline() != 0 || h.scheduler.offline_count() != 1) {
    return fail("test_offline_failures_stay_parked", "failed drain should keep the firing parked");
  }
  return 0;
}

int test_timer_thread_fires_due_jobs() {
  MemoryTaskStore store;
  TaskManager tasks(store);
  EventBus bus;
  FakeDispatcher dispatcher;
  Scheduler scheduler(tasks, bus, dispatcher);

  scheduler.start();
  if (!scheduler.schedule("soon", nullptr, one_time_at(orchestra::core::Clock::now() + 50ms), "echo")) {
    scheduler.stop();
    return fail("test_timer_thread_fires_due_jobs", "schedule should succeed");
  }

  const auto deadline = std::chrono::steady_clock::now() + 3s;
  while (dispatcher.dispatched().empty() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  scheduler.stop();

  if (dispatcher.dispatched().size() != 1) {
    return fail("test_timer_thread_fires_due_jobs", "background timer should fire the job");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_cron_parse_accepts_and_rejects(); rc != 0) return rc;
  if (int rc = test_cron_next_after(); rc != 0) return rc;
  if (int rc = test_validate_rejects_inconsistent_configs(); rc != 0) return rc;
  if (int rc = test_duplicate_and_missing_jobs(); rc != 0) return rc;
  if (int rc = test_schedule_publishes_task_scheduled(); rc != 0) return rc;
  if (int rc = test_one_time_fires_once(); rc != 0) return rc;
  if (int rc = test_recurring_skips_missed_intervals(); rc != 0) return rc;
  if (int rc = test_failed_firing_retries_then_gives_up(); rc != 0) return rc;
  if (int rc = test_retry_recovers_when_dispatch_succeeds(); rc != 0) return rc;
  if (int rc = test_no_retry_when_disabled(); rc != 0) return rc;
  if (int rc = test_offline_firings_wait_for_dispatcher(); rc != 0) return rc;
  if (int rc = test_offline_failures_stay_parked(); rc != 0) return rc;
  if (int rc = test_timer_thread_fires_due_jobs(); rc != 0) return rc;

  std::cout << "[PASS] scheduler unit tests\n";
  return 0;
}

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "core/result.hpp"
#include "model/event.hpp"

namespace orchestra::bus {

// Subscribers are identified by the handler object, so subscribing the same
// handler twice is a no-op.
class EventHandler {
 public:
  virtual ~EventHandler() = default;
  virtual void on_event(const model::event& event) = 0;
};

std::shared_ptr<EventHandler> make_handler(std::function<void(const model::event&)> callback);

inline constexpr std::size_t kDefaultQueueCapacity = 1000;

// Bounded FIFO of events with a single consumer. The consumer is either the
// background thread started by start() or a caller of drain(); never both at
// once. Delivery order is arrival order; event priority is not consulted.
class EventBus {
 public:
  explicit EventBus(std::size_t capacity = kDefaultQueueCapacity);
  ~EventBus();

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  void subscribe(const std::string& event_type, std::shared_ptr<EventHandler> handler);
  void unsubscribe(const std::string& event_type, const std::shared_ptr<EventHandler>& handler);

  // Never blocks; fails with ErrorKind::queue_full at capacity.
  core::Result<void> publish(model::event event);

  void start();
  // Joins the consumer thread. Undelivered events stay queued.
  void stop();
  [[nodiscard]] bool running() const;

  // Delivers every queued event on the calling thread. Returns the count.
  std::size_t drain();

  [[nodiscard]] std::size_t queue_depth() const;
  [[nodiscard]] std::size_t subscriber_count(const std::string& event_type) const;
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  void clear();

 private:
  void consume_loop();
  bool deliver_next();
  void deliver(const model::event& event);

  const std::size_t capacity_;

  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<model::event> queue_;
  bool stopping_{false};
  bool consuming_{false};

  mutable std::mutex subscribers_mutex_;
  std::unordered_map<std::string, std::vector<std::shared_ptr<EventHandler>>> subscribers_;

  std::mutex consumer_mutex_;
  std::thread consumer_;
};

}  // namespace orchestra::bus

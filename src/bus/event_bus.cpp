#include "bus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

namespace orchestra::bus {
namespace {

class CallbackHandler final : public EventHandler {
 public:
  explicit CallbackHandler(std::function<void(const model::event&)> callback) : callback_(std::move(callback)) {}

  void on_event(const model::event& event) override { callback_(event); }

 private:
  std::function<void(const model::event&)> callback_;
};

}  // namespace

std::shared_ptr<EventHandler> make_handler(std::function<void(const model::event&)> callback) {
  return std::make_shared<CallbackHandler>(std::move(callback));
}

EventBus::EventBus(const std::size_t capacity) : capacity_(capacity) {}

EventBus::~EventBus() { stop(); }

void EventBus::subscribe(const std::string& event_type, std::shared_ptr<EventHandler> handler) {
  if (handler == nullptr) {
    return;
  }

  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  auto& handlers = subscribers_[event_type];
  if (std::find(handlers.begin(), handlers.end(), handler) != handlers.end()) {
    return;
  }
  handlers.push_back(std::move(handler));
  std::cerr << "[event_bus] subscribed to " << event_type << '\n';
}

void EventBus::unsubscribe(const std::string& event_type, const std::shared_ptr<EventHandler>& handler) {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  const auto it = subscribers_.find(event_type);
  if (it == subscribers_.end()) {
    return;
  }

  auto& handlers = it->second;
  const auto before = handlers.size();
  handlers.erase(std::remove(handlers.begin(), handlers.end(), handler), handlers.end());
  if (handlers.size() != before) {
    std::cerr << "[event_bus] unsubscribed from " << event_type << '\n';
  }
  if (handlers.empty()) {
    subscribers_.erase(it);
  }
}

core::Result<void> EventBus::publish(model::event event) {
  if (!event.timestamp.has_value()) {
    event.timestamp = core::Clock::now();
  }

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (queue_.size() >= capacity_) {
      return core::make_error(core::ErrorKind::queue_full,
                              "event queue at capacity " + std::to_string(capacity_) + ", dropped " + event.type);
    }
    queue_.push_back(std::move(event));
  }
  queue_cv_.notify_one();
  return core::ok();
}

void EventBus::start() {
  std::lock_guard<std::mutex> lock(consumer_mutex_);
  if (consumer_.joinable()) {
    return;
  }

  {
    std::lock_guard<std::mutex> queue_lock(queue_mutex_);
    stopping_ = false;
    consuming_ = true;
  }
  consumer_ = std::thread([this]() { consume_loop(); });
  std::cerr << "[event_bus] started\n";
}

void EventBus::stop() {
  std::lock_guard<std::mutex> lock(consumer_mutex_);
  if (!consumer_.joinable()) {
    return;
  }

  {
    std::lock_guard<std::mutex> queue_lock(queue_mutex_);
    stopping_ = true;
  }
  queue_cv_.notify_all();
  consumer_.join();
  {
    std::lock_guard<std::mutex> queue_lock(queue_mutex_);
    consuming_ = false;
  }
  std::cerr << "[event_bus] stopped\n";
}

bool EventBus::running() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return consuming_ && !stopping_;
}

void EventBus::consume_loop() {
  while (deliver_next()) {
  }
}

// Blocks until an event arrives or stop() is requested.
bool EventBus::deliver_next() {
  model::event event;
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
    if (stopping_) {
      return false;
    }
    event = std::move(queue_.front());
    queue_.pop_front();
  }

  deliver(event);
  return true;
}

std::size_t EventBus::drain() {
  std::unique_lock<std::mutex> consumer_lock(consumer_mutex_, std::try_to_lock);
  if (!consumer_lock.owns_lock() || consumer_.joinable()) {
    // The background consumer owns delivery.
    return 0;
  }

  std::size_t delivered = 0;
  while (true) {
    model::event event;
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      if (queue_.empty()) {
        break;
      }
      event = std::move(queue_.front());
      queue_.pop_front();
    }
    deliver(event);
    ++delivered;
  }
  return delivered;
}

void EventBus::deliver(const model::event& event) {
  std::vector<std::shared_ptr<EventHandler>> handlers;
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    const auto it = subscribers_.find(event.type);
    if (it == subscribers_.end()) {
      return;
    }
    handlers = it->second;
  }

  for (const auto& handler : handlers) {
    try {
      handler->on_event(event);
    } catch (const std::exception& ex) {
      std::cerr << "[event_bus] handler error for " << event.type << ": " << ex.what() << '\n';
    } catch (...) {
      std::cerr << "[event_bus] unknown handler error for " << event.type << '\n';
    }
  }
}

std::size_t EventBus::queue_depth() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return queue_.size();
}

std::size_t EventBus::subscriber_count(const std::string& event_type) const {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  const auto it = subscribers_.find(event_type);
  return it == subscribers_.end() ? 0 : it->second.size();
}

void EventBus::clear() {
  std::size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    dropped = queue_.size();
    queue_.clear();
  }
  std::cerr << "[event_bus] cleared " << dropped << " queued events\n";
}

}  // namespace orchestra::bus

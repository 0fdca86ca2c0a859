#include "orch/worker_pool.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace orchestra::orch {

WorkHandle::state WorkHandle::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool WorkHandle::finished() const {
  const auto now = current();
  return now == state::DONE || now == state::CANCELLED;
}

void WorkHandle::wait() const {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]() { return state_ == state::DONE || state_ == state::CANCELLED; });
}

WorkerPool::WorkerPool(const std::size_t workers) {
  const std::size_t count = workers == 0 ? 1 : workers;
  workers_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    workers_.emplace_back([this]() { worker_loop(); });
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    accepting_ = false;
    stopping_ = true;
  }
  cv_.notify_all();
  join_all();
}

void WorkerPool::set_state(WorkHandle& handle, const WorkHandle::state next) {
  {
    std::lock_guard<std::mutex> lock(handle.mutex_);
    handle.state_ = next;
  }
  handle.cv_.notify_all();
}

std::shared_ptr<WorkHandle> WorkerPool::submit(std::function<void()> work) {
  auto handle = std::make_shared<WorkHandle>();
  handle->work_ = std::move(work);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_) {
      return nullptr;
    }
    queue_.push_back(handle);
  }
  cv_.notify_one();
  return handle;
}

bool WorkerPool::cancel(const std::shared_ptr<WorkHandle>& handle) {
  if (handle == nullptr) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = queue_.begin(); it != queue_.end(); ++it) {
    if (*it == handle) {
      queue_.erase(it);
      set_state(*handle, WorkHandle::state::CANCELLED);
      return true;
    }
  }
  return false;
}

void WorkerPool::worker_loop() {
  while (true) {
    std::shared_ptr<WorkHandle> handle;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      handle = std::move(queue_.front());
      queue_.pop_front();
      ++busy_;
      // The RUNNING flip happens under the pool lock so cancel() cannot
      // observe a popped item as still queued.
      set_state(*handle, WorkHandle::state::RUNNING);
    }

    try {
      handle->work_();
    } catch (const std::exception& ex) {
      std::cerr << "[worker_pool] work item threw: " << ex.what() << '\n';
    } catch (...) {
      std::cerr << "[worker_pool] work item threw a non-standard exception\n";
    }
    handle->work_ = nullptr;
    set_state(*handle, WorkHandle::state::DONE);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      --busy_;
    }
  }
}

void WorkerPool::shutdown(const bool wait) {
  std::deque<std::shared_ptr<WorkHandle>> dropped;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    accepting_ = false;
    stopping_ = true;
    if (!wait) {
      dropped.swap(queue_);
    }
  }
  cv_.notify_all();

  for (const auto& handle : dropped) {
    set_state(*handle, WorkHandle::state::CANCELLED);
  }
  if (wait) {
    join_all();
  }
}

void WorkerPool::join_all() {
  for (auto& worker : workers_) {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
}

std::size_t WorkerPool::idle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!accepting_) {
    return 0;
  }
  const std::size_t pending = queue_.size() + busy_;
  return pending >= workers_.size() ? 0 : workers_.size() - pending;
}

std::size_t WorkerPool::queued() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

}  // namespace orchestra::orch

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace orchestra::orch {

class WorkHandle {
 public:
  enum class state : std::uint8_t { QUEUED, RUNNING, DONE, CANCELLED };

  [[nodiscard]] state current() const;
  [[nodiscard]] bool finished() const;
  void wait() const;

 private:
  friend class WorkerPool;

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  state state_{state::QUEUED};
  std::function<void()> work_;
};

// Fixed set of worker threads draining a FIFO of work items. An item can be
// cancelled only while it is still queued.
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t workers);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Returns nullptr once the pool is shut down.
  std::shared_ptr<WorkHandle> submit(std::function<void()> work);
  bool cancel(const std::shared_ptr<WorkHandle>& handle);

  // wait=true finishes queued and running work and joins the workers.
  // wait=false cancels queued work and returns; running work finishes in the
  // background and the destructor joins.
  void shutdown(bool wait);

  [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }
  [[nodiscard]] std::size_t idle() const;
  [[nodiscard]] std::size_t queued() const;

 private:
  void worker_loop();
  static void set_state(WorkHandle& handle, WorkHandle::state next);
  void join_all();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::shared_ptr<WorkHandle>> queue_;
  std::size_t busy_{0};
  bool accepting_{true};
  bool stopping_{false};
  std::vector<std::thread> workers_;
};

}  // namespace orchestra::orch

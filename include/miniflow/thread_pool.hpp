#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace miniflow {

// ==========================================
// Worker pool for dispatched action bodies
// ==========================================

// Workers share the queue through a shared_ptr, so a pool can let go of
// workers that are stuck in a task (Abandon) without joining them.
class ThreadPool {
 public:
  explicit ThreadPool(size_t threads = std::thread::hardware_concurrency())
      : shared_(std::make_shared<Shared>()) {
    threads = std::max<size_t>(threads, 1);
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
      workers_.emplace_back([shared = shared_] { WorkerLoop(*shared); });
    }
  }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  template <class F>
  void Enqueue(F&& f) {
    {
      std::lock_guard<std::mutex> lock(shared_->mu);
      if (shared_->stop) {
        throw std::runtime_error("Enqueue on stopped ThreadPool");
      }
      shared_->tasks.emplace(std::forward<F>(f));
    }
    shared_->cv.notify_one();
  }

  size_t Size() const { return workers_.size(); }

  // Tasks currently executing on a worker.
  size_t Busy() const {
    std::lock_guard<std::mutex> lock(shared_->mu);
    return shared_->busy;
  }

  // Drops queued tasks and detaches every worker. A worker inside a task
  // exits once that task returns. Returns the number of such stragglers.
  size_t Abandon() {
    size_t busy = 0;
    {
      std::lock_guard<std::mutex> lock(shared_->mu);
      shared_->stop = true;
      std::queue<std::function<void()>>().swap(shared_->tasks);
      busy = shared_->busy;
    }
    shared_->cv.notify_all();
    for (std::thread& worker : workers_) worker.detach();
    workers_.clear();
    return busy;
  }

  // Drains queued tasks, then joins.
  ~ThreadPool() {
    {
      std::lock_guard<std::mutex> lock(shared_->mu);
      shared_->stop = true;
    }
    shared_->cv.notify_all();
    for (std::thread& worker : workers_) {
      worker.join();
    }
  }

 private:
  struct Shared {
    mutable std::mutex mu;
    std::condition_variable cv;
    std::queue<std::function<void()>> tasks;
    size_t busy = 0;
    bool stop = false;
  };

  static void WorkerLoop(Shared& shared) {
    while (true) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(shared.mu);
        shared.cv.wait(lock, [&] { return shared.stop || !shared.tasks.empty(); });
        if (shared.stop && shared.tasks.empty()) {
          return;
        }
        task = std::move(shared.tasks.front());
        shared.tasks.pop();
        ++shared.busy;
      }
      task();
      std::lock_guard<std::mutex> lock(shared.mu);
      --shared.busy;
    }
  }

  std::shared_ptr<Shared> shared_;
  std::vector<std::thread> workers_;
};

}  // namespace miniflow

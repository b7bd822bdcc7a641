#include "scheduler/thread_pool.hpp"
#include <stdexcept>
#include "common/logger.hpp"

ThreadPool::ThreadPool(size_t workers, std::string name) : name_(std::move(name)) {
  if (workers == 0) throw std::invalid_argument("pool " + name_ + " needs at least one worker");
  workers_.reserve(workers);
  for (size_t i = 0; i < workers; ++i) workers_.emplace_back(&ThreadPool::WorkerLoop, this);
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  wake_.notify_all();
  for (auto& w : workers_) w.join();
}

void ThreadPool::Enqueue(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) throw std::runtime_error("pool " + name_ + " is shutting down");
    queue_.push_back(std::move(task));
  }
  wake_.notify_one();
}

size_t ThreadPool::Outstanding() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size() + running_;
}

void ThreadPool::WorkerLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
    if (queue_.empty()) return; // stopping and drained
    std::function<void()> task = std::move(queue_.front());
    queue_.pop_front();
    ++running_;
    lock.unlock();
    try {
      task();
    } catch (const std::exception& e) {
      // Submit() tasks never get here; their exceptions land in the future.
      Logger::Error("Task in pool " + name_ + " threw: " + e.what());
    }
    lock.lock();
    --running_;
  }
}

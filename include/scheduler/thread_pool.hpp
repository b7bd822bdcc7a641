#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed set of workers draining a FIFO queue. The worker count is the
// concurrency limit: at most Size() tasks run at once, the rest wait.
// Destruction finishes every task already queued.
class ThreadPool {
public:
  ThreadPool(size_t workers, std::string name);
  ~ThreadPool();
  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Throws std::runtime_error once the pool is shutting down.
  void Enqueue(std::function<void()> task);

  // The task's result, or the exception it threw, arrives through the future.
  template <typename F>
  auto Submit(F fn) -> std::future<std::invoke_result_t<F>> {
    using R = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    std::future<R> result = task->get_future();
    Enqueue([task] { (*task)(); });
    return result;
  }

  size_t Size() const { return workers_.size(); }
  // Queued plus running.
  size_t Outstanding() const;
  const std::string& Name() const { return name_; }

private:
  void WorkerLoop();

  std::string name_;
  std::vector<std::thread> workers_;
  std::deque<std::function<void()>> queue_;
  mutable std::mutex mutex_;
  std::condition_variable wake_;
  size_t running_ = 0;
  bool stopping_ = false;
};

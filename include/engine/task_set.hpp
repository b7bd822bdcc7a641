#pragma once
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

struct TaskOutcome {
  enum class Status {
    kCompleted, // body returned normally
    kFailed,    // body threw a std::exception
    kFaulted    // body threw something that is not a std::exception
  };
  std::string name;
  Status status = Status::kCompleted;
  std::string error;

  bool Ok() const { return status == Status::kCompleted; }
};

const char* TaskStatusName(TaskOutcome::Status status);

// A group of named tasks, one thread each. Outcomes are reported in
// completion order through JoinNext. A failing task never cancels its
// siblings. Tasks still running when the set is destroyed are detached.
class TaskSet {
public:
  TaskSet() : state_(std::make_shared<State>()) {}
  TaskSet(TaskSet&&) = default;
  TaskSet& operator=(TaskSet&&) = default;
  TaskSet(const TaskSet&) = delete;
  TaskSet& operator=(const TaskSet&) = delete;
  ~TaskSet();

  template <typename F>
  void Spawn(std::string name, F fn) {
    auto state = state_;
    size_t index = threads_.size();
    threads_.emplace_back([state, index, name = std::move(name), fn = std::move(fn)]() mutable {
      TaskOutcome outcome;
      outcome.name = name;
      try {
        fn();
      } catch (const std::exception& e) {
        outcome.status = TaskOutcome::Status::kFailed;
        outcome.error = e.what();
      } catch (...) {
        outcome.status = TaskOutcome::Status::kFaulted;
        outcome.error = "terminated by a non-standard exception";
      }
      state->Complete(index, std::move(outcome));
    });
  }

  // Blocks until the next task finishes. nullopt when every spawned task has
  // already been reported.
  std::optional<TaskOutcome> JoinNext();

  size_t Size() const { return threads_.size(); }
  size_t Pending() const { return threads_.size() - joined_; }

private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::pair<size_t, TaskOutcome>> done;

    void Complete(size_t index, TaskOutcome outcome) {
      {
        std::lock_guard<std::mutex> lock(mutex);
        done.emplace_back(index, std::move(outcome));
      }
      cv.notify_all();
    }
  };

  std::shared_ptr<State> state_;
  std::vector<std::thread> threads_;
  size_t joined_ = 0;
};

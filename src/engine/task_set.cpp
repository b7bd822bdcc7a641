#include "engine/task_set.hpp"

const char* TaskStatusName(TaskOutcome::Status status) {
  switch (status) {
    case TaskOutcome::Status::kCompleted: return "completed";
    case TaskOutcome::Status::kFailed: return "failed";
    case TaskOutcome::Status::kFaulted: return "faulted";
  }
  return "unknown";
}

TaskSet::~TaskSet() {
  for (auto& t : threads_) {
    if (t.joinable()) t.detach();
  }
}

std::optional<TaskOutcome> TaskSet::JoinNext() {
  if (Pending() == 0) return std::nullopt;
  std::pair<size_t, TaskOutcome> next;
  {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this]{ return !state_->done.empty(); });
    next = std::move(state_->done.front());
    state_->done.pop_front();
  }
  // The body has returned; the thread is only unwinding its lambda.
  if (threads_[next.first].joinable()) threads_[next.first].join();
  ++joined_;
  return std::move(next.second);
}

#pragma once
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/logger.hpp"

template <typename T>
class BroadcastChannel;

// One receiver's view of a BroadcastChannel: an unbounded FIFO of every item
// published after it subscribed.
template <typename T>
class Subscription {
public:
  explicit Subscription(std::string label, size_t lag_warning)
    : label_(std::move(label)), lag_warning_(lag_warning) {}

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  // Blocks until an item is available. Returns nullopt once the channel is
  // closed and everything published before the close has been received.
  std::optional<T> Recv() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]{ return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;
    T item = std::move(queue_.front());
    queue_.pop_front();
    return item;
  }

  std::optional<T> TryRecv() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) return std::nullopt;
    T item = std::move(queue_.front());
    queue_.pop_front();
    return item;
  }

  size_t Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

private:
  friend class BroadcastChannel<T>;

  void Push(const T& item) {
    bool warn = false;
    size_t depth = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push_back(item);
      depth = queue_.size();
      // Warn once per crossing of the threshold.
      if (lag_warning_ > 0 && depth == lag_warning_) warn = true;
    }
    cv_.notify_one();
    if (warn) Logger::Warning("Receiver " + label_ + " is lagging: " + std::to_string(depth) + " items pending");
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  std::string label_;
  size_t lag_warning_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  bool closed_ = false;
};

// Multi-producer broadcast bus: every live subscription receives every item.
// Items from one producer reach each receiver in publish order. A receiver
// whose Subscription has been destroyed is skipped.
template <typename T>
class BroadcastChannel {
public:
  explicit BroadcastChannel(std::string name, size_t lag_warning = 512)
    : name_(std::move(name)), lag_warning_(lag_warning) {}

  BroadcastChannel(const BroadcastChannel&) = delete;
  BroadcastChannel& operator=(const BroadcastChannel&) = delete;

  std::shared_ptr<Subscription<T>> Subscribe() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sub = std::make_shared<Subscription<T>>(name_ + "#" + std::to_string(next_id_++), lag_warning_);
    if (closed_) sub->Close();
    else subscribers_.push_back(sub);
    return sub;
  }

  // Returns the number of receivers the item was delivered to.
  size_t Publish(const T& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return 0;
    size_t delivered = 0;
    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
      if (auto sub = it->lock()) {
        sub->Push(item);
        ++delivered;
        ++it;
      } else {
        it = subscribers_.erase(it);
      }
    }
    return delivered;
  }

  void Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    closed_ = true;
    for (auto& weak : subscribers_) {
      if (auto sub = weak.lock()) sub->Close();
    }
    subscribers_.clear();
  }

  size_t ReceiverCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& weak : subscribers_) if (!weak.expired()) ++n;
    return n;
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  const std::string& Name() const { return name_; }

private:
  std::string name_;
  size_t lag_warning_;
  mutable std::mutex mutex_;
  std::vector<std::weak_ptr<Subscription<T>>> subscribers_;
  size_t next_id_ = 0;
  bool closed_ = false;
};

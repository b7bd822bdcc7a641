#include "collectors/mev_share_collector.hpp"
#include <algorithm>
#include <chrono>
#include "common/errors.hpp"
#include "common/logger.hpp"

MevShareEventStream::MevShareEventStream(std::string url, ReconnectPolicy policy, HttpClientTuning tuning)
  : client_(std::move(url), std::move(tuning)), policy_(policy) {
  reader_ = std::thread([this]{ ReadLoop(); });
}

MevShareEventStream::~MevShareEventStream() {
  Stop();
  if (reader_.joinable()) reader_.join();
}

void MevShareEventStream::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_.store(true);
  }
  cv_.notify_all();
}

void MevShareEventStream::WaitUntilOpen() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]{ return open_state_ != OpenState::kPending; });
  if (open_state_ == OpenState::kFailed)
    throw SourceUnavailable("cannot open " + client_.Url() + ": " + open_error_);
}

std::optional<MevShareEvent> MevShareEventStream::Next() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]{ return !queue_.empty() || ended_; });
  if (queue_.empty()) return std::nullopt;
  MevShareEvent ev = std::move(queue_.front());
  queue_.pop_front();
  return ev;
}

void MevShareEventStream::OnMessage(const SseMessage& msg) {
  if (msg.event != "message") return;
  MevShareEvent ev;
  try {
    ev = ParseMevShareEvent(msg.data);
  } catch (const std::exception& e) {
    Logger::Warning("Skipping malformed mev-share event: " + std::string(e.what()));
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(ev));
  }
  cv_.notify_all();
}

void MevShareEventStream::SleepBackoff(int ms) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, std::chrono::milliseconds(ms), [this]{ return stop_.load(); });
}

void MevShareEventStream::ReadLoop() {
  int backoff_ms = policy_.initial_backoff_ms;
  bool first_attempt = true;

  auto on_open = [this](long status) {
    if (status < 200 || status >= 300) return;
    Logger::Info("Connected to " + client_.Url());
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_state_ == OpenState::kPending) {
      open_state_ = OpenState::kOpen;
      cv_.notify_all();
    }
  };
  auto on_message = [this](const SseMessage& msg) { OnMessage(msg); };

  while (!stop_.load()) {
    SseResult result = client_.Run(on_open, on_message, stop_);
    if (first_attempt && !result.opened) {
      std::lock_guard<std::mutex> lock(mutex_);
      open_state_ = OpenState::kFailed;
      open_error_ = result.error.empty() ? "HTTP " + std::to_string(result.status) : result.error;
      cv_.notify_all();
      break;
    }
    first_attempt = false;
    if (stop_.load()) break;

    if (result.opened) backoff_ms = policy_.initial_backoff_ms;
    std::string reason = result.error.empty() ? "server closed the stream" : result.error;
    Logger::Warning("mev-share stream lost (" + reason + "), reconnect #" + std::to_string(++reconnects_) +
                    " in " + std::to_string(backoff_ms) + "ms");
    SleepBackoff(backoff_ms);
    backoff_ms = std::min(backoff_ms * 2, policy_.max_backoff_ms);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    ended_ = true;
  }
  cv_.notify_all();
}

MevShareCollector::MevShareCollector(std::string url, ReconnectPolicy policy, HttpClientTuning tuning)
  : url_(std::move(url)), policy_(policy), tuning_(std::move(tuning)) {}

std::unique_ptr<EventStream<MevShareEvent>> MevShareCollector::GetEventStream() {
  auto stream = std::make_unique<MevShareEventStream>(url_, policy_, tuning_);
  stream->WaitUntilOpen();
  Logger::Info("Subscribed to mev-share events at " + url_);
  return stream;
}

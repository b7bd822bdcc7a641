#include "telemetry/structured_logger.hpp"
#include <fstream>
#include <chrono>
#include "common/logger.hpp"

StructuredLogger& StructuredLogger::Instance() {
  static StructuredLogger inst;
  return inst;
}

StructuredLogger::~StructuredLogger() { Shutdown(); }

void StructuredLogger::Initialize(const std::string& file_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!running_) {
    file_path_ = file_path;
    running_ = true;
    worker_ = std::thread(&StructuredLogger::Worker, this);
  }
}

void StructuredLogger::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void StructuredLogger::LogEvent(const std::string& event, nlohmann::json fields) {
  auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  fields["ts"] = now;
  fields["event"] = event;
  LogJsonLine(fields.dump());
}

void StructuredLogger::BundleSubmitted(const std::string& relay, unsigned long long block,
                                       const std::string& bundle_hash, long long latency_ms) {
  LogEvent("bundle_submitted", {{"relay", relay}, {"block", block},
                                {"bundle_hash", bundle_hash}, {"latency_ms", latency_ms}});
}

void StructuredLogger::BundleFailed(const std::string& relay, unsigned long long block,
                                    const std::string& error_kind, const std::string& error, long long latency_ms) {
  LogEvent("bundle_failed", {{"relay", relay}, {"block", block}, {"error_kind", error_kind},
                             {"error", error}, {"latency_ms", latency_ms}});
}

void StructuredLogger::LogJsonLine(std::string json_line) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    queue_.push(std::move(json_line));
  }
  cv_.notify_one();
}

void StructuredLogger::Worker() {
  std::ofstream out(file_path_, std::ios::app | std::ios::out);
  if (!out.is_open()) Logger::Error("Cannot open metrics file " + file_path_ + ", metrics are discarded");
  std::string batch;
  batch.reserve(8192);
  while (true) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(80), [&]{ return !queue_.empty() || !running_; });
    if (!running_ && queue_.empty()) break;
    while (!queue_.empty()) {
      batch.append(queue_.front());
      batch.push_back('\n');
      queue_.pop();
      if (batch.size() > 4096) break;
    }
    lock.unlock();
    if (!batch.empty() && out.is_open()) {
      out << batch;
      out.flush();
    }
    batch.clear();
  }
}

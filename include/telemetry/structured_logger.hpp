#pragma once
#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <queue>
#include <nlohmann/json.hpp>

// JSONL metrics sink: one JSON object per line, written by a background
// thread. Lines logged before Initialize (or after Shutdown) are dropped.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  void Initialize(const std::string& file_path);
  void Shutdown();

  // Adds "ts" (unix ms) and "event" to `fields` and enqueues the line.
  void LogEvent(const std::string& event, nlohmann::json fields);

  void BundleSubmitted(const std::string& relay, unsigned long long block,
                       const std::string& bundle_hash, long long latency_ms);
  void BundleFailed(const std::string& relay, unsigned long long block,
                    const std::string& error_kind, const std::string& error, long long latency_ms);
private:
  StructuredLogger() = default;
  ~StructuredLogger();
  void LogJsonLine(std::string json_line);
  void Worker();
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  bool running_ = false;
  std::string file_path_;
};

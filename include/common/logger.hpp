#pragma once
#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <queue>
#include <thread>
#include <condition_variable>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

struct LogRecord {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string message;
  std::thread::id thread_id;
};

// Process-wide asynchronous logger. Callers only enqueue; a single worker
// thread formats and writes, so logging never blocks on file I/O.
class Logger {
  static std::unique_ptr<Logger> instance_;
  static std::mutex instance_mutex_;
  std::ofstream log_file_;
  bool echo_stderr_ = false;
  std::mutex log_mutex_;
  std::queue<LogRecord> log_queue_;
  std::thread worker_thread_;
  std::condition_variable cv_;
  bool running_ = false;
  LogLevel min_level_ = LogLevel::INFO;
  Logger() = default;
  void WorkerFunction();
  void WriteLogEntry(const LogRecord&);
  static std::string FormatLogEntry(const LogRecord&);
public:
  // Empty path disables the file sink.
  static void Initialize(const std::string& path, LogLevel min_level = LogLevel::INFO, bool echo_stderr = true);
  static void Shutdown();
  static bool IsEnabled(LogLevel level);
  static void Log(LogLevel level, const std::string& message);
  static void Debug(const std::string& m);
  static void Info(const std::string& m);
  static void Warning(const std::string& m);
  static void Error(const std::string& m);
  static void Critical(const std::string& m);
  static std::string LevelToString(LogLevel);
  // Accepts debug|info|warn|warning|error|critical (any case); unknown -> fallback
  static LogLevel ParseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);
  ~Logger();
};

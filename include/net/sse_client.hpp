#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <vector>
#include "net/http_client.hpp"

struct SseMessage {
  std::string event;  // "message" when the server sends no event field
  std::string data;   // data lines joined with '\n'
  std::string id;
};

// Incremental text/event-stream decoder. Bytes may be fed in arbitrary chunks.
class SseParser {
public:
  void Feed(const char* data, size_t len, std::vector<SseMessage>& out);
  void Reset();
private:
  void HandleLine(const std::string& line, std::vector<SseMessage>& out);
  std::string line_buf_;
  std::string event_;
  std::string data_;
  std::string id_;
  bool has_data_ = false;
};

struct SseResult {
  long status = 0;     // final HTTP status, 0 when no response arrived
  bool opened = false; // a 2xx response was received
  std::string error;   // transport error text, empty on clean close or stop
};

// Long-lived GET of an event-stream endpoint over libcurl.
class SseClient {
public:
  using OnOpenFn = std::function<void(long status)>;
  using OnMessageFn = std::function<void(const SseMessage&)>;

  explicit SseClient(std::string url, HttpClientTuning tuning = HttpClientTuning{});

  // Blocks until the server closes the stream, a transport error occurs or
  // `stop` becomes true. on_open fires once the response headers are in.
  SseResult Run(const OnOpenFn& on_open, const OnMessageFn& on_message, const std::atomic<bool>& stop);

  const std::string& Url() const { return url_; }

private:
  std::string url_;
  HttpClientTuning tuning_;
};

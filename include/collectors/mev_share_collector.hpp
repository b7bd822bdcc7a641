#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "engine/types.hpp"
#include "net/sse_client.hpp"
#include "strategy/types.hpp"

struct ReconnectPolicy {
  int initial_backoff_ms = 500;
  int max_backoff_ms = 30'000;
};

// Live stream of mev-share hints. A reader thread owns the SSE connection and
// reconnects with capped exponential backoff after the server drops it.
class MevShareEventStream : public EventStream<MevShareEvent> {
public:
  MevShareEventStream(std::string url, ReconnectPolicy policy, HttpClientTuning tuning);
  ~MevShareEventStream() override;

  // Blocks until the first connection attempt is decided. Throws
  // SourceUnavailable on a transport failure or a non-2xx status.
  void WaitUntilOpen();

  std::optional<MevShareEvent> Next() override;

  void Stop();

private:
  enum class OpenState { kPending, kOpen, kFailed };

  void ReadLoop();
  void OnMessage(const SseMessage& msg);
  void SleepBackoff(int ms);

  SseClient client_;
  ReconnectPolicy policy_;
  std::atomic<bool> stop_{false};
  size_t reconnects_ = 0; // reader thread only
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<MevShareEvent> queue_;
  OpenState open_state_ = OpenState::kPending;
  std::string open_error_;
  bool ended_ = false;
  std::thread reader_;
};

class MevShareCollector : public Collector<MevShareEvent> {
public:
  explicit MevShareCollector(std::string url,
                             ReconnectPolicy policy = ReconnectPolicy{},
                             HttpClientTuning tuning = HttpClientTuning{});
  std::unique_ptr<EventStream<MevShareEvent>> GetEventStream() override;
  std::string Name() const override { return "mev-share"; }
private:
  std::string url_;
  ReconnectPolicy policy_;
  HttpClientTuning tuning_;
};

#pragma once
#include <atomic>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "engine/broadcast.hpp"
#include "engine/task_set.hpp"
#include "engine/types.hpp"

// What the owner of a TaskSet should do when a task ends with a failure.
enum class FailurePolicy {
  kDegrade,      // log and keep the remaining tasks running
  kAbortProcess  // log and terminate the process
};

struct EngineOptions {
  // Depth at which a lagging receiver is reported.
  size_t event_lag_warning = 512;
  size_t action_lag_warning = 512;
  FailurePolicy failure_policy = FailurePolicy::kDegrade;
};

// Wires collectors -> event bus -> strategies -> action bus -> executors.
// Components are registered while the engine is being configured; Run moves
// them into their own tasks and the engine cannot be reconfigured after.
template <typename E, typename A>
class Engine {
public:
  explicit Engine(EngineOptions options = {})
    : options_(options),
      events_(std::make_shared<BroadcastChannel<E>>("events", options.event_lag_warning)),
      actions_(std::make_shared<BroadcastChannel<A>>("actions", options.action_lag_warning)) {}

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  Engine& AddCollector(std::unique_ptr<Collector<E>> collector) {
    EnsureConfiguring("AddCollector");
    if (!collector) throw std::invalid_argument("AddCollector: null collector");
    collectors_.push_back(std::move(collector));
    return *this;
  }

  Engine& AddStrategy(std::unique_ptr<Strategy<E, A>> strategy) {
    EnsureConfiguring("AddStrategy");
    if (!strategy) throw std::invalid_argument("AddStrategy: null strategy");
    strategies_.push_back(std::move(strategy));
    return *this;
  }

  Engine& AddExecutor(std::unique_ptr<Executor<A>> executor) {
    EnsureConfiguring("AddExecutor");
    if (!executor) throw std::invalid_argument("AddExecutor: null executor");
    executors_.push_back(std::move(executor));
    return *this;
  }

  // Syncs every strategy, then starts one task per component. Throws
  // StateSyncFailure (and starts nothing) if any strategy fails to sync.
  TaskSet Run() {
    EnsureConfiguring("Run");
    started_ = true;

    for (auto& strategy : strategies_) {
      try {
        strategy->SyncState();
      } catch (const std::exception& e) {
        throw StateSyncFailure("strategy " + strategy->Name() + " failed to sync state: " + e.what());
      }
      Logger::Info("Synced state for strategy " + strategy->Name());
    }

    // Every receiver exists before any producer starts, so nothing published
    // by a collector or strategy can be missed.
    std::vector<std::shared_ptr<Subscription<A>>> executor_rx;
    for (size_t i = 0; i < executors_.size(); ++i) executor_rx.push_back(actions_->Subscribe());
    std::vector<std::shared_ptr<Subscription<E>>> strategy_rx;
    for (size_t i = 0; i < strategies_.size(); ++i) strategy_rx.push_back(events_->Subscribe());

    TaskSet tasks;
    strategies_running_ = strategies_.size();
    auto live_strategies = std::make_shared<std::atomic<size_t>>(strategies_.size());

    for (size_t i = 0; i < executors_.size(); ++i) {
      std::string name = executors_[i]->Name();
      tasks.Spawn("executor:" + name, [executor = std::move(executors_[i]), rx = executor_rx[i], name]() mutable {
        while (auto action = rx->Recv()) {
          try {
            executor->Execute(*action);
          } catch (const std::exception& e) {
            Logger::Error("Executor " + name + " failed: " + e.what());
          }
        }
      });
    }

    for (size_t i = 0; i < strategies_.size(); ++i) {
      std::string name = strategies_[i]->Name();
      tasks.Spawn("strategy:" + name, [strategy = std::move(strategies_[i]), rx = strategy_rx[i],
                                       actions = actions_, live_strategies, name]() mutable {
        LastOneCloses<A> closer{live_strategies, actions};
        while (auto event = rx->Recv()) {
          std::optional<A> action;
          try {
            action = strategy->ProcessEvent(*event);
          } catch (const std::exception& e) {
            Logger::Error("Strategy " + name + " dropped an event: " + e.what());
            continue;
          }
          if (action && actions->Publish(*action) == 0)
            Logger::Warning("Strategy " + name + " produced an action with no executor listening");
        }
      });
    }

    for (size_t i = 0; i < collectors_.size(); ++i) {
      std::string name = collectors_[i]->Name();
      tasks.Spawn("collector:" + name, [collector = std::move(collectors_[i]), events = events_, name]() mutable {
        auto stream = collector->GetEventStream();
        size_t count = 0;
        while (auto event = stream->Next()) {
          events->Publish(*event);
          ++count;
        }
        Logger::Warning("Collector " + name + " stream ended after " + std::to_string(count) + " events");
      });
    }

    collectors_.clear();
    strategies_.clear();
    executors_.clear();
    Logger::Info("Engine started " + std::to_string(tasks.Size()) + " tasks");
    return tasks;
  }

  // Closes the event bus. Strategies drain their queues and return; the last
  // one out closes the action bus, after which executors drain and return.
  void Shutdown() {
    events_->Close();
    if (!started_ || strategies_running_ == 0) actions_->Close();
  }

  // Applies the configured failure policy to one joined task.
  bool ShouldAbort(const TaskOutcome& outcome) const {
    return !outcome.Ok() && options_.failure_policy == FailurePolicy::kAbortProcess;
  }

  size_t CollectorCount() const { return collectors_.size(); }

private:
  // Closes the action bus when the last strategy task exits, however it exits.
  template <typename T>
  struct LastOneCloses {
    std::shared_ptr<std::atomic<size_t>> live;
    std::shared_ptr<BroadcastChannel<T>> bus;
    ~LastOneCloses() { if (live->fetch_sub(1) == 1) bus->Close(); }
  };

  void EnsureConfiguring(const char* op) const {
    if (started_) throw std::logic_error(std::string(op) + " called after Engine::Run");
  }

  EngineOptions options_;
  std::shared_ptr<BroadcastChannel<E>> events_;
  std::shared_ptr<BroadcastChannel<A>> actions_;
  std::vector<std::unique_ptr<Collector<E>>> collectors_;
  std::vector<std::unique_ptr<Strategy<E, A>>> strategies_;
  std::vector<std::unique_ptr<Executor<A>>> executors_;
  size_t strategies_running_ = 0;
  bool started_ = false;
};

#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

// Pull-based event source. Next blocks until an event is available and
// returns nullopt once the stream has ended.
template <typename E>
class EventStream {
public:
  virtual ~EventStream() = default;
  virtual std::optional<E> Next() = 0;
};

template <typename E>
class Collector {
public:
  virtual ~Collector() = default;
  // Opening the source may fail (throws, typically SourceUnavailable).
  virtual std::unique_ptr<EventStream<E>> GetEventStream() = 0;
  virtual std::string Name() const { return "collector"; }
};

template <typename E, typename A>
class Strategy {
public:
  virtual ~Strategy() = default;
  // Called exactly once, before the first ProcessEvent.
  virtual void SyncState() = 0;
  virtual std::optional<A> ProcessEvent(const E& event) = 0;
  virtual std::string Name() const { return "strategy"; }
};

template <typename A>
class Executor {
public:
  virtual ~Executor() = default;
  virtual void Execute(const A& action) = 0;
  virtual std::string Name() const { return "executor"; }
};

template <typename E, typename N>
class MappedEventStream : public EventStream<E> {
public:
  MappedEventStream(std::unique_ptr<EventStream<N>> inner, std::function<E(N)> map)
    : inner_(std::move(inner)), map_(std::move(map)) {}

  std::optional<E> Next() override {
    auto item = inner_->Next();
    if (!item) return std::nullopt;
    return map_(std::move(*item));
  }

private:
  std::unique_ptr<EventStream<N>> inner_;
  std::function<E(N)> map_;
};

// Lifts a Collector<N> into a Collector<E>, mapping every event one to one.
template <typename E, typename N>
class CollectorMap : public Collector<E> {
public:
  CollectorMap(std::unique_ptr<Collector<N>> inner, std::function<E(N)> map)
    : inner_(std::move(inner)), map_(std::move(map)) {
    if (!inner_) throw std::invalid_argument("CollectorMap: null collector");
  }

  std::unique_ptr<EventStream<E>> GetEventStream() override {
    return std::make_unique<MappedEventStream<E, N>>(inner_->GetEventStream(), map_);
  }

  std::string Name() const override { return inner_->Name(); }

private:
  std::unique_ptr<Collector<N>> inner_;
  std::function<E(N)> map_;
};

// Lifts an Executor<N> into an Executor<A>. Actions the projection rejects
// are ignored.
template <typename A, typename N>
class ExecutorMap : public Executor<A> {
public:
  ExecutorMap(std::unique_ptr<Executor<N>> inner, std::function<std::optional<N>(const A&)> project)
    : inner_(std::move(inner)), project_(std::move(project)) {
    if (!inner_) throw std::invalid_argument("ExecutorMap: null executor");
  }

  void Execute(const A& action) override {
    auto inner_action = project_(action);
    if (inner_action) inner_->Execute(*inner_action);
  }

  std::string Name() const override { return inner_->Name(); }

private:
  std::unique_ptr<Executor<N>> inner_;
  std::function<std::optional<N>(const A&)> project_;
};

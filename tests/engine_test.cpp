#include <gtest/gtest.h>
#include <algorithm>
#include "engine/engine.hpp"
#include "engine_fakes.hpp"

using namespace testing_support;

namespace {

// Multiplies every event by a factor; optionally rejects odd events by throwing.
class ScalingStrategy : public Strategy<int, int> {
public:
  ScalingStrategy(int factor, bool throw_on_odd = false, std::shared_ptr<std::atomic<int>> syncs = nullptr)
    : factor_(factor), throw_on_odd_(throw_on_odd), syncs_(std::move(syncs)) {}
  void SyncState() override {
    if (syncs_) ++*syncs_;
    synced_ = true;
  }
  std::optional<int> ProcessEvent(const int& event) override {
    if (!synced_) throw std::logic_error("event before sync");
    if (throw_on_odd_ && event % 2 != 0) throw std::runtime_error("odd event");
    return event * factor_;
  }
  std::string Name() const override { return "scale" + std::to_string(factor_); }
private:
  int factor_;
  bool throw_on_odd_;
  std::shared_ptr<std::atomic<int>> syncs_;
  bool synced_ = false;
};

// Records every event it is handed, in arrival order, and emits it shifted
// by `offset`.
class SequenceStrategy : public Strategy<int, int> {
public:
  SequenceStrategy(std::shared_ptr<ActionLog<int>> seen, std::string name, int offset = 0)
    : seen_(std::move(seen)), name_(std::move(name)), offset_(offset) {}
  void SyncState() override {}
  std::optional<int> ProcessEvent(const int& event) override {
    seen_->Add(event);
    return event + offset_;
  }
  std::string Name() const override { return name_; }
private:
  std::shared_ptr<ActionLog<int>> seen_;
  std::string name_;
  int offset_;
};

class FailingSyncStrategy : public Strategy<int, int> {
public:
  void SyncState() override { throw std::runtime_error("pool file missing"); }
  std::optional<int> ProcessEvent(const int&) override { return std::nullopt; }
  std::string Name() const override { return "broken"; }
};

std::vector<int> Range(int n) {
  std::vector<int> v;
  for (int i = 0; i < n; ++i) v.push_back(i);
  return v;
}

// Joins every task, shutting the engine down once every collector has ended.
std::vector<TaskOutcome> RunToCompletion(Engine<int, int>& engine, TaskSet& tasks, size_t collectors) {
  std::vector<TaskOutcome> outcomes;
  while (auto outcome = tasks.JoinNext()) {
    if (outcome->name.rfind("collector:", 0) == 0 && --collectors == 0) engine.Shutdown();
    outcomes.push_back(*outcome);
  }
  return outcomes;
}

} // namespace

TEST(Engine, EveryExecutorSeesEveryActionFromEveryStrategy) {
  constexpr int kEvents = 50;
  Engine<int, int> engine;
  auto log_a = std::make_shared<ActionLog<int>>();
  auto log_b = std::make_shared<ActionLog<int>>();
  engine.AddCollector(std::make_unique<VectorCollector<int>>(Range(kEvents)));
  engine.AddStrategy(std::make_unique<ScalingStrategy>(10));
  engine.AddStrategy(std::make_unique<ScalingStrategy>(100));
  engine.AddExecutor(std::make_unique<RecordingExecutor<int>>(log_a));
  engine.AddExecutor(std::make_unique<RecordingExecutor<int>>(log_b));

  TaskSet tasks = engine.Run();
  EXPECT_EQ(tasks.Size(), 5u);
  auto outcomes = RunToCompletion(engine, tasks, 1);
  ASSERT_EQ(outcomes.size(), 5u);
  for (const auto& o : outcomes) EXPECT_TRUE(o.Ok()) << o.name << ": " << o.error;

  std::vector<int> expected;
  for (int i = 0; i < kEvents; ++i) {
    expected.push_back(i * 10);
    expected.push_back(i * 100);
  }
  std::sort(expected.begin(), expected.end());
  for (auto& log : {log_a, log_b}) {
    auto actions = log->Snapshot();
    std::sort(actions.begin(), actions.end());
    EXPECT_EQ(actions, expected);
  }
}

TEST(Engine, SyncRunsOnceBeforeAnyEvent) {
  auto syncs = std::make_shared<std::atomic<int>>(0);
  auto log = std::make_shared<ActionLog<int>>();
  Engine<int, int> engine;
  engine.AddCollector(std::make_unique<VectorCollector<int>>(Range(10)));
  engine.AddStrategy(std::make_unique<ScalingStrategy>(1, false, syncs));
  engine.AddExecutor(std::make_unique<RecordingExecutor<int>>(log));

  TaskSet tasks = engine.Run();
  auto outcomes = RunToCompletion(engine, tasks, 1);
  for (const auto& o : outcomes) EXPECT_TRUE(o.Ok()) << o.name << ": " << o.error;
  EXPECT_EQ(syncs->load(), 1);
  EXPECT_EQ(log->Snapshot().size(), 10u);
}

TEST(Engine, SyncFailureAbortsStartup) {
  auto opens = std::make_shared<std::atomic<int>>(0);
  Engine<int, int> engine;
  engine.AddCollector(std::make_unique<UnavailableCollector<int>>(opens));
  engine.AddStrategy(std::make_unique<ScalingStrategy>(1));
  engine.AddStrategy(std::make_unique<FailingSyncStrategy>());

  try {
    engine.Run();
    FAIL() << "expected StateSyncFailure";
  } catch (const StateSyncFailure& e) {
    EXPECT_NE(std::string(e.what()).find("broken"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("pool file missing"), std::string::npos);
  }
  EXPECT_EQ(opens->load(), 0);
}

TEST(Engine, RegistrationAfterRunIsRejected) {
  Engine<int, int> engine;
  TaskSet tasks = engine.Run();
  EXPECT_EQ(tasks.Size(), 0u);
  EXPECT_THROW(engine.AddCollector(std::make_unique<VectorCollector<int>>(Range(1))), std::logic_error);
  EXPECT_THROW(engine.AddStrategy(std::make_unique<ScalingStrategy>(1)), std::logic_error);
  EXPECT_THROW(engine.AddExecutor(std::make_unique<RecordingExecutor<int>>(std::make_shared<ActionLog<int>>())),
               std::logic_error);
  EXPECT_THROW(engine.Run(), std::logic_error);
}

TEST(Engine, ProcessEventErrorSkipsOnlyThatEvent) {
  auto log = std::make_shared<ActionLog<int>>();
  Engine<int, int> engine;
  engine.AddCollector(std::make_unique<VectorCollector<int>>(Range(20)));
  engine.AddStrategy(std::make_unique<ScalingStrategy>(1, true));
  engine.AddExecutor(std::make_unique<RecordingExecutor<int>>(log));

  TaskSet tasks = engine.Run();
  auto outcomes = RunToCompletion(engine, tasks, 1);
  for (const auto& o : outcomes) EXPECT_TRUE(o.Ok()) << o.name;
  auto actions = log->Snapshot();
  ASSERT_EQ(actions.size(), 10u);
  for (int a : actions) EXPECT_EQ(a % 2, 0);
}

TEST(Engine, ExecutorErrorsDoNotStopItsLoop) {
  auto log = std::make_shared<ActionLog<int>>();
  Engine<int, int> engine;
  engine.AddCollector(std::make_unique<VectorCollector<int>>(Range(8)));
  engine.AddStrategy(std::make_unique<ScalingStrategy>(1));
  engine.AddExecutor(std::make_unique<RecordingExecutor<int>>(log, true));

  TaskSet tasks = engine.Run();
  auto outcomes = RunToCompletion(engine, tasks, 1);
  for (const auto& o : outcomes) EXPECT_TRUE(o.Ok()) << o.name;
  EXPECT_EQ(log->Snapshot().size(), 8u);
}

TEST(Engine, UnavailableCollectorFailsOnlyItsOwnTask) {
  auto log = std::make_shared<ActionLog<int>>();
  Engine<int, int> engine;
  engine.AddCollector(std::make_unique<UnavailableCollector<int>>());
  engine.AddCollector(std::make_unique<VectorCollector<int>>(Range(5)));
  engine.AddStrategy(std::make_unique<ScalingStrategy>(1));
  engine.AddExecutor(std::make_unique<RecordingExecutor<int>>(log));

  TaskSet tasks = engine.Run();
  auto outcomes = RunToCompletion(engine, tasks, 2);
  size_t failed = 0;
  for (const auto& o : outcomes) {
    if (o.Ok()) continue;
    ++failed;
    EXPECT_EQ(o.name, "collector:unavailable");
    EXPECT_EQ(o.status, TaskOutcome::Status::kFailed);
    EXPECT_EQ(o.error, "connection refused");
  }
  EXPECT_EQ(failed, 1u);
  EXPECT_EQ(log->Snapshot().size(), 5u);
}

TEST(Engine, ShutdownWithoutStrategiesEndsExecutors) {
  Engine<int, int> engine;
  engine.AddExecutor(std::make_unique<RecordingExecutor<int>>(std::make_shared<ActionLog<int>>()));
  TaskSet tasks = engine.Run();
  engine.Shutdown();
  auto outcome = tasks.JoinNext();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->Ok());
  EXPECT_FALSE(tasks.JoinNext().has_value());
}

TEST(Engine, EachStrategySeesEveryEventOnceInProducerOrder) {
  constexpr int kEvents = 500;
  auto seen_a = std::make_shared<ActionLog<int>>();
  auto seen_b = std::make_shared<ActionLog<int>>();
  auto executed = std::make_shared<ActionLog<int>>();
  Engine<int, int> engine;
  engine.AddCollector(std::make_unique<VectorCollector<int>>(Range(kEvents)));
  engine.AddStrategy(std::make_unique<SequenceStrategy>(seen_a, "a"));
  engine.AddStrategy(std::make_unique<SequenceStrategy>(seen_b, "b", kEvents));
  engine.AddExecutor(std::make_unique<RecordingExecutor<int>>(executed));

  TaskSet tasks = engine.Run();
  auto outcomes = RunToCompletion(engine, tasks, 1);
  for (const auto& o : outcomes) EXPECT_TRUE(o.Ok()) << o.name << ": " << o.error;

  EXPECT_EQ(seen_a->Snapshot(), Range(kEvents));
  EXPECT_EQ(seen_b->Snapshot(), Range(kEvents));

  // Actions from both strategies interleave, but each strategy's own actions
  // reach the executor in the order it produced them.
  auto actions = executed->Snapshot();
  ASSERT_EQ(actions.size(), 2u * kEvents);
  std::vector<int> from_a, from_b;
  for (int a : actions) (a < kEvents ? from_a : from_b).push_back(a);
  EXPECT_EQ(from_a, Range(kEvents));
  std::vector<int> expected_b;
  for (int i = 0; i < kEvents; ++i) expected_b.push_back(i + kEvents);
  EXPECT_EQ(from_b, expected_b);
}

TEST(Engine, SingleStrategyActionsArriveInOrder) {
  constexpr int kEvents = 300;
  auto executed = std::make_shared<ActionLog<int>>();
  Engine<int, int> engine;
  engine.AddCollector(std::make_unique<VectorCollector<int>>(Range(kEvents)));
  engine.AddStrategy(std::make_unique<ScalingStrategy>(3));
  engine.AddExecutor(std::make_unique<RecordingExecutor<int>>(executed));

  TaskSet tasks = engine.Run();
  auto outcomes = RunToCompletion(engine, tasks, 1);
  for (const auto& o : outcomes) EXPECT_TRUE(o.Ok()) << o.name;

  std::vector<int> expected;
  for (int i = 0; i < kEvents; ++i) expected.push_back(i * 3);
  EXPECT_EQ(executed->Snapshot(), expected);
}

TEST(Engine, AbortPolicyAppliesOnlyToFailedTasks) {
  TaskOutcome ok;
  ok.name = "collector:a";
  ok.status = TaskOutcome::Status::kCompleted;
  TaskOutcome failed;
  failed.name = "collector:b";
  failed.status = TaskOutcome::Status::kFailed;
  failed.error = "connection refused";

  Engine<int, int> degrade;
  EXPECT_FALSE(degrade.ShouldAbort(ok));
  EXPECT_FALSE(degrade.ShouldAbort(failed));

  EngineOptions options;
  options.failure_policy = FailurePolicy::kAbortProcess;
  Engine<int, int> abort_on_failure(options);
  EXPECT_FALSE(abort_on_failure.ShouldAbort(ok));
  EXPECT_TRUE(abort_on_failure.ShouldAbort(failed));
}

#include <gtest/gtest.h>
#include <variant>
#include "engine/types.hpp"
#include "engine_fakes.hpp"

using namespace testing_support;

namespace {
struct Ping { int n; };
struct Pong { std::string s; };
using WideAction = std::variant<Ping, Pong>;
}

TEST(CollectorMap, LiftsEveryItem) {
  CollectorMap<std::string, int> mapped(std::make_unique<VectorCollector<int>>(std::vector<int>{1, 2, 3}, "ints"),
                                        [](int n) { return std::string(static_cast<size_t>(n), 'x'); });
  EXPECT_EQ(mapped.Name(), "ints");
  auto stream = mapped.GetEventStream();
  EXPECT_EQ(*stream->Next(), "x");
  EXPECT_EQ(*stream->Next(), "xx");
  EXPECT_EQ(*stream->Next(), "xxx");
  EXPECT_FALSE(stream->Next().has_value());
}

TEST(CollectorMap, OpenFailurePropagates) {
  CollectorMap<std::string, int> mapped(std::make_unique<UnavailableCollector<int>>(),
                                        [](int n) { return std::to_string(n); });
  EXPECT_THROW(mapped.GetEventStream(), SourceUnavailable);
}

TEST(ExecutorMap, ProjectionRunsOncePerActionAndFilters) {
  auto log = std::make_shared<ActionLog<int>>();
  int projections = 0;
  ExecutorMap<WideAction, int> mapped(std::make_unique<RecordingExecutor<int>>(log),
                                      [&projections](const WideAction& a) -> std::optional<int> {
                                        ++projections;
                                        if (const auto* p = std::get_if<Ping>(&a)) return p->n;
                                        return std::nullopt;
                                      });
  mapped.Execute(Ping{1});
  mapped.Execute(Pong{"ignored"});
  mapped.Execute(Ping{2});

  EXPECT_EQ(projections, 3);
  EXPECT_EQ(log->Snapshot(), (std::vector<int>{1, 2}));
  EXPECT_EQ(mapped.Name(), "recording");
}

TEST(ExecutorMap, InnerFailurePropagates) {
  ExecutorMap<WideAction, int> mapped(std::make_unique<RecordingExecutor<int>>(std::make_shared<ActionLog<int>>(), true),
                                      [](const WideAction&) -> std::optional<int> { return 0; });
  EXPECT_THROW(mapped.Execute(Ping{0}), std::runtime_error);
}

TEST(ExecutorMap, RejectsNullExecutor) {
  EXPECT_THROW((ExecutorMap<WideAction, int>(nullptr, [](const WideAction&) -> std::optional<int> { return 0; })),
               std::invalid_argument);
}

#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "engine/types.hpp"
#include "matchmaker/client.hpp"
#include "net/multi_relay.hpp"
#include "scheduler/thread_pool.hpp"

using Bundles = std::vector<BundleRequest>;

struct SubmissionSummary {
  size_t submitted = 0;
  size_t failed = 0;
};

// Sends bundles to one relay. Relay failures are logged and counted, never
// rethrown, so one bad relay or bundle cannot stop the others.
class MevShareExecutor : public Executor<Bundles> {
public:
  static constexpr size_t kMaxInFlightBundles = 5;

  MevShareExecutor(HttpClient& http,
                   std::shared_ptr<const Signer> auth_signer,
                   const RelayEndpoint& relay,
                   int timeout_ms = 5000);

  // Returns once every bundle has an outcome.
  void Execute(const Bundles& bundles) override;
  std::string Name() const override { return client_.Name(); }

  const std::string& Url() const { return client_.Url(); }
  SubmissionSummary LastSummary() const;

private:
  bool SubmitOne(const BundleRequest& bundle);

  MatchmakerClient client_;
  ThreadPool pool_;
  mutable std::mutex summary_mutex_;
  SubmissionSummary last_;
};

// One executor per registry entry, in registry order.
std::vector<std::unique_ptr<MevShareExecutor>> BuildRelayExecutors(HttpClient& http,
                                                                   const std::shared_ptr<const Signer>& auth_signer,
                                                                   const std::vector<RelayEndpoint>& relays,
                                                                   int timeout_ms = 5000);

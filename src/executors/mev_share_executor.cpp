#include "executors/mev_share_executor.hpp"
#include <chrono>
#include <future>
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"

MevShareExecutor::MevShareExecutor(HttpClient& http,
                                   std::shared_ptr<const Signer> auth_signer,
                                   const RelayEndpoint& relay,
                                   int timeout_ms)
  : client_(http, std::move(auth_signer), relay.url, relay.name, timeout_ms),
    pool_(kMaxInFlightBundles, "relay:" + relay.name) {}

void MevShareExecutor::Execute(const Bundles& bundles) {
  std::vector<std::future<bool>> results;
  results.reserve(bundles.size());
  for (const auto& bundle : bundles) {
    results.push_back(pool_.Submit([this, &bundle]{ return SubmitOne(bundle); }));
  }

  SubmissionSummary summary;
  for (auto& r : results) {
    if (r.get()) ++summary.submitted;
    else ++summary.failed;
  }
  {
    std::lock_guard<std::mutex> lock(summary_mutex_);
    last_ = summary;
  }
  if (!bundles.empty()) {
    Logger::Info("Relay " + client_.Name() + ": " + std::to_string(summary.submitted) + " bundles accepted, " +
                 std::to_string(summary.failed) + " failed");
  }
}

SubmissionSummary MevShareExecutor::LastSummary() const {
  std::lock_guard<std::mutex> lock(summary_mutex_);
  return last_;
}

bool MevShareExecutor::SubmitOne(const BundleRequest& bundle) {
  auto start = std::chrono::steady_clock::now();
  auto elapsed_ms = [&start] {
    return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count());
  };
  try {
    SendBundleResponse resp = client_.SendBundle(bundle);
    Logger::Info("Bundle response from " + client_.Name() + ": " + resp.bundle_hash);
    StructuredLogger::Instance().BundleSubmitted(client_.Name(), bundle.inclusion.block, resp.bundle_hash, elapsed_ms());
    return true;
  } catch (const RpcError& e) {
    Logger::Error(std::string("Bundle error (") + RpcErrorKindName(e.kind()) + "): " + e.what());
    StructuredLogger::Instance().BundleFailed(client_.Name(), bundle.inclusion.block, RpcErrorKindName(e.kind()), e.what(), elapsed_ms());
  } catch (const std::exception& e) {
    Logger::Error("Bundle error at " + client_.Name() + ": " + e.what());
    StructuredLogger::Instance().BundleFailed(client_.Name(), bundle.inclusion.block, "internal", e.what(), elapsed_ms());
  }
  return false;
}

std::vector<std::unique_ptr<MevShareExecutor>> BuildRelayExecutors(HttpClient& http,
                                                                   const std::shared_ptr<const Signer>& auth_signer,
                                                                   const std::vector<RelayEndpoint>& relays,
                                                                   int timeout_ms) {
  std::vector<std::unique_ptr<MevShareExecutor>> out;
  out.reserve(relays.size());
  for (const auto& relay : relays) {
    out.push_back(std::make_unique<MevShareExecutor>(http, auth_signer, relay, timeout_ms));
  }
  return out;
}

#include "executors/flashbots_executor.hpp"
#include <chrono>
#include <stdexcept>
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"

using json = nlohmann::json;

json SendBundleParams(const SignedBundle& bundle) {
  json txs = json::array();
  for (const auto& tx : bundle.txs) txs.push_back(BytesToHex0x(tx));
  return json{{"txs", std::move(txs)}, {"blockNumber", ToHexQuantity(bundle.block)}};
}

json CallBundleParams(const SignedBundle& bundle) {
  json params = SendBundleParams(bundle);
  params["stateBlockNumber"] = ToHexQuantity(bundle.state_block);
  params["timestamp"] = bundle.simulation_timestamp;
  return params;
}

FlashbotsExecutor::FlashbotsExecutor(HttpClient& http,
                                     std::shared_ptr<NodeClient> node,
                                     std::shared_ptr<const TransactionSigner> tx_signer,
                                     std::shared_ptr<const Signer> auth_signer,
                                     const RelayEndpoint& relay,
                                     int timeout_ms)
  : client_(http, std::move(auth_signer), relay.url, relay.name, timeout_ms),
    node_(std::move(node)),
    tx_signer_(std::move(tx_signer)) {
  if (!node_ || !tx_signer_) throw std::invalid_argument("FlashbotsExecutor requires a node and a transaction signer");
}

void FlashbotsExecutor::Execute(const FlashbotsBundle& txs) {
  FlashbotsOutcome outcome;
  if (txs.empty()) {
    Logger::Debug("Relay " + client_.Name() + ": empty bundle ignored");
  } else {
    SignedBundle bundle;
    for (const auto& tx : txs) bundle.txs.push_back(tx_signer_->SignTransaction(tx));
    unsigned long long head = node_->GetBlockNumber();
    bundle.block = head + 1;
    bundle.state_block = head;
    bundle.simulation_timestamp = 0;

    Simulate(bundle, outcome);
    Send(bundle, outcome);
  }
  std::lock_guard<std::mutex> lock(outcome_mutex_);
  last_ = outcome;
}

FlashbotsOutcome FlashbotsExecutor::LastOutcome() const {
  std::lock_guard<std::mutex> lock(outcome_mutex_);
  return last_;
}

void FlashbotsExecutor::Simulate(const SignedBundle& bundle, FlashbotsOutcome& outcome) {
  json result;
  try {
    result = client_.Call("eth_callBundle", json::array({CallBundleParams(bundle)}));
  } catch (const RpcError& e) {
    Logger::Error(std::string("Error simulating bundle (") + RpcErrorKindName(e.kind()) + "): " + e.what());
    return;
  }
  outcome.simulated = true;
  if (!result.is_object() || !result.contains("results") || !result["results"].is_array()) return;
  for (const auto& tx : result["results"]) {
    if (tx.contains("error") || tx.contains("revert")) {
      outcome.simulation_reverted = true;
      Logger::Warning("Bundle simulation at " + client_.Name() + " reverted: " + tx.dump());
    }
  }
}

void FlashbotsExecutor::Send(const SignedBundle& bundle, FlashbotsOutcome& outcome) {
  auto start = std::chrono::steady_clock::now();
  auto elapsed_ms = [&start] {
    return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count());
  };
  try {
    json result = client_.Call("eth_sendBundle", json::array({SendBundleParams(bundle)}));
    if (result.is_object() && result.contains("bundleHash") && result["bundleHash"].is_string())
      outcome.bundle_hash = result["bundleHash"].get<std::string>();
    outcome.sent = true;
    Logger::Info("Bundle sent to " + client_.Name() + " for block " + std::to_string(bundle.block) +
                 (outcome.bundle_hash.empty() ? "" : ": " + outcome.bundle_hash));
    StructuredLogger::Instance().BundleSubmitted(client_.Name(), bundle.block, outcome.bundle_hash, elapsed_ms());
  } catch (const RpcError& e) {
    Logger::Error(std::string("Error sending bundle (") + RpcErrorKindName(e.kind()) + "): " + e.what());
    StructuredLogger::Instance().BundleFailed(client_.Name(), bundle.block, RpcErrorKindName(e.kind()), e.what(), elapsed_ms());
  }
}

std::vector<std::unique_ptr<FlashbotsExecutor>> BuildFlashbotsExecutors(HttpClient& http,
                                                                        const std::shared_ptr<NodeClient>& node,
                                                                        const std::shared_ptr<const TransactionSigner>& tx_signer,
                                                                        const std::shared_ptr<const Signer>& auth_signer,
                                                                        const std::vector<RelayEndpoint>& relays,
                                                                        int timeout_ms) {
  std::vector<std::unique_ptr<FlashbotsExecutor>> out;
  out.reserve(relays.size());
  for (const auto& relay : relays) {
    out.push_back(std::make_unique<FlashbotsExecutor>(http, node, tx_signer, auth_signer, relay, timeout_ms));
  }
  return out;
}

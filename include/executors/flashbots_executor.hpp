#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/types.hpp"
#include "matchmaker/client.hpp"
#include "net/multi_relay.hpp"
#include "node_connection/node_client.hpp"

// Fully filled transactions, signed and sent together as one bundle.
using FlashbotsBundle = std::vector<TransactionFields>;

// Parameters shared by eth_callBundle and eth_sendBundle.
struct SignedBundle {
  std::vector<Bytes> txs;
  unsigned long long block = 0;            // block the bundle targets
  unsigned long long state_block = 0;      // simulation runs on top of this block
  unsigned long long simulation_timestamp = 0;
};

// {"txs":[...],"blockNumber":"0x.."}
nlohmann::json SendBundleParams(const SignedBundle& bundle);
// SendBundleParams plus "stateBlockNumber" and "timestamp".
nlohmann::json CallBundleParams(const SignedBundle& bundle);

struct FlashbotsOutcome {
  bool simulated = false;        // eth_callBundle answered
  bool simulation_reverted = false;
  bool sent = false;             // eth_sendBundle answered
  std::string bundle_hash;
};

// Signs a bundle of transactions, simulates it against the current head and
// sends it for the next block. Simulation and relay errors are logged; the
// bundle is sent even when simulation fails. Signing and block-number
// failures throw.
class FlashbotsExecutor : public Executor<FlashbotsBundle> {
public:
  FlashbotsExecutor(HttpClient& http,
                    std::shared_ptr<NodeClient> node,
                    std::shared_ptr<const TransactionSigner> tx_signer,
                    std::shared_ptr<const Signer> auth_signer,
                    const RelayEndpoint& relay,
                    int timeout_ms = 5000);

  void Execute(const FlashbotsBundle& txs) override;
  std::string Name() const override { return client_.Name(); }

  FlashbotsOutcome LastOutcome() const;

private:
  void Simulate(const SignedBundle& bundle, FlashbotsOutcome& outcome);
  void Send(const SignedBundle& bundle, FlashbotsOutcome& outcome);

  MatchmakerClient client_;
  std::shared_ptr<NodeClient> node_;
  std::shared_ptr<const TransactionSigner> tx_signer_;
  mutable std::mutex outcome_mutex_;
  FlashbotsOutcome last_;
};

// One executor per registry entry, in registry order.
std::vector<std::unique_ptr<FlashbotsExecutor>> BuildFlashbotsExecutors(HttpClient& http,
                                                                        const std::shared_ptr<NodeClient>& node,
                                                                        const std::shared_ptr<const TransactionSigner>& tx_signer,
                                                                        const std::shared_ptr<const Signer>& auth_signer,
                                                                        const std::vector<RelayEndpoint>& relays,
                                                                        int timeout_ms = 5000);

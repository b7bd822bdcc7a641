#pragma once
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "engine/types.hpp"
#include "utils/hex.hpp"

class RpcClient;

// One pending transaction as reported by txpool_content.
struct MempoolTransaction {
  std::string hash;  // normalized 0x lower-case
  std::string from;
  std::optional<std::string> to; // empty for contract creation
  unsigned long long nonce = 0;
  unsigned long long gas = 0;
  std::string value; // hex quantity as sent; may exceed 64 bits
  std::optional<unsigned long long> gas_price;
  std::optional<unsigned long long> max_fee_per_gas;
  std::optional<unsigned long long> max_priority_fee_per_gas;
  Bytes input;
};

void from_json(const nlohmann::json& j, MempoolTransaction& tx);

// Snapshot of the node's pending pool. Each GetEventStream issues one
// txpool_content call and yields its pending transactions, grouped by sender
// in address order and by ascending nonce within a sender, then ends.
class MempoolCollector : public Collector<MempoolTransaction> {
public:
  explicit MempoolCollector(std::shared_ptr<RpcClient> rpc);
  // Throws SourceUnavailable when the node cannot serve txpool_content.
  std::unique_ptr<EventStream<MempoolTransaction>> GetEventStream() override;
  std::string Name() const override { return "mempool"; }
private:
  std::shared_ptr<RpcClient> rpc_;
};

#include "collectors/mempool_collector.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "node_connection/rpc_client.hpp"

namespace {
std::optional<unsigned long long> OptionalQuantity(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return std::nullopt;
  return ParseHexQuantity(it->get<std::string>());
}

class SnapshotStream : public EventStream<MempoolTransaction> {
public:
  explicit SnapshotStream(std::vector<MempoolTransaction> txs) : txs_(std::move(txs)) {}
  std::optional<MempoolTransaction> Next() override {
    if (pos_ >= txs_.size()) return std::nullopt;
    return std::move(txs_[pos_++]);
  }
private:
  std::vector<MempoolTransaction> txs_;
  size_t pos_ = 0;
};
}

void from_json(const nlohmann::json& j, MempoolTransaction& tx) {
  tx.hash = NormalizeHash(j.at("hash").get<std::string>());
  tx.from = NormalizeAddress(j.at("from").get<std::string>());
  tx.to.reset();
  if (j.contains("to") && !j.at("to").is_null()) tx.to = NormalizeAddress(j.at("to").get<std::string>());
  tx.nonce = ParseHexQuantity(j.at("nonce").get<std::string>());
  tx.gas = ParseHexQuantity(j.at("gas").get<std::string>());
  tx.value = j.contains("value") ? ToLowerHex(j.at("value").get<std::string>()) : "0x0";
  tx.gas_price = OptionalQuantity(j, "gasPrice");
  tx.max_fee_per_gas = OptionalQuantity(j, "maxFeePerGas");
  tx.max_priority_fee_per_gas = OptionalQuantity(j, "maxPriorityFeePerGas");
  tx.input = j.contains("input") ? HexToBytes(j.at("input").get<std::string>()) : Bytes{};
}

MempoolCollector::MempoolCollector(std::shared_ptr<RpcClient> rpc) : rpc_(std::move(rpc)) {
  if (!rpc_) throw std::invalid_argument("MempoolCollector requires an RPC client");
}

std::unique_ptr<EventStream<MempoolTransaction>> MempoolCollector::GetEventStream() {
  nlohmann::json content;
  try {
    content = rpc_->Call("txpool_content", nlohmann::json::array());
  } catch (const RpcError& e) {
    throw SourceUnavailable(std::string("txpool_content failed: ") + e.what());
  }
  if (!content.is_object() || !content.contains("pending") || !content["pending"].is_object())
    throw SourceUnavailable("txpool_content returned no pending pool");

  // Object keys come back sorted, so senders are already in address order.
  std::vector<MempoolTransaction> txs;
  size_t skipped = 0;
  for (const auto& sender : content["pending"].items()) {
    std::vector<MempoolTransaction> by_sender;
    for (const auto& entry : sender.value().items()) {
      try {
        by_sender.push_back(entry.value().get<MempoolTransaction>());
      } catch (const std::exception& e) {
        ++skipped;
        Logger::Warning("Skipping malformed pending transaction from " + sender.key() + ": " + e.what());
      }
    }
    std::sort(by_sender.begin(), by_sender.end(),
              [](const MempoolTransaction& a, const MempoolTransaction& b) { return a.nonce < b.nonce; });
    for (auto& tx : by_sender) txs.push_back(std::move(tx));
  }
  Logger::Info("Mempool snapshot: " + std::to_string(txs.size()) + " pending transactions" +
               (skipped ? ", " + std::to_string(skipped) + " skipped" : ""));
  return std::make_unique<SnapshotStream>(std::move(txs));
}

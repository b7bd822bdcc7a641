#include "strategy/mev_share_uni_arb.hpp"
#include <stdexcept>
#include <variant>
#include "common/errors.hpp"
#include "common/logger.hpp"

MevShareUniArb::MevShareUniArb(std::shared_ptr<NodeClient> node,
                               std::shared_ptr<const TransactionSigner> signer,
                               std::unique_ptr<ArbContract> arb_contract,
                               std::string pools_csv,
                               BundleOptions bundle_options)
  : node_(std::move(node)), signer_(std::move(signer)), arb_contract_(std::move(arb_contract)),
    pools_csv_(std::move(pools_csv)), bundle_options_(std::move(bundle_options)) {
  if (!node_ || !signer_ || !arb_contract_) throw std::invalid_argument("MevShareUniArb: null dependency");
}

void MevShareUniArb::SyncState() {
  try {
    pools_ = LoadPoolTableCsv(pools_csv_);
  } catch (const std::exception& e) {
    throw StateSyncFailure(e.what());
  }
  Logger::Info("Loaded " + std::to_string(pools_.Size()) + " v3/v2 pool pairs from " + pools_csv_);
}

std::optional<Action> MevShareUniArb::ProcessEvent(const Event& event) {
  if (const auto* hint = std::get_if<MevShareEvent>(&event)) return OnMevShareEvent(*hint);
  return std::nullopt;
}

std::optional<Action> MevShareUniArb::OnMevShareEvent(const MevShareEvent& event) {
  Logger::Debug("Received mev-share event " + event.hash + " with " + std::to_string(event.logs.size()) + " logs");
  if (event.logs.empty()) return std::nullopt;

  // Only the first log is considered.
  const std::string& address = event.logs.front().address;
  if (pools_.Find(address) == nullptr) return std::nullopt;

  Logger::Info("Found a v3 pool match at " + address + " for " + event.hash + ", building bundles");
  auto bundles = GenerateBundles(address, event.hash);
  if (bundles.empty()) {
    Logger::Warning("No bundles could be built for " + event.hash);
    return std::nullopt;
  }
  return Action{SubmitBundles{std::move(bundles)}};
}

std::vector<BundleRequest> MevShareUniArb::GenerateBundles(const std::string& v3_pool, const std::string& tx_hash) {
  std::vector<BundleRequest> bundles;
  const V2PoolInfo* v2_info = pools_.Find(v3_pool);
  if (v2_info == nullptr) return bundles;

  // Bid and target block are shared by every rung.
  unsigned long long bid_gas_price = 0;
  unsigned long long block_number = 0;
  try {
    bid_gas_price = node_->GetGasPrice();
    block_number = node_->GetBlockNumber();
  } catch (const std::exception& e) {
    Logger::Error("Cannot price backrun of " + tx_hash + ": " + e.what());
    return bundles;
  }

  for (uint64_t size : kLadderSizes) {
    TransactionFields arb_tx;
    try {
      arb_tx = arb_contract_->BuildArbitrageCall(v2_info->v2_pool, v3_pool, size, kPayoutPercentage, v2_info->weth_token0);
      arb_tx.gas_limit = kArbGasLimit;
      arb_tx.SetGasPrice(bid_gas_price);
      node_->FillTransaction(arb_tx);
    } catch (const std::exception& e) {
      Logger::Error("Error filling arb tx of size " + std::to_string(size) + ": " + e.what());
      continue;
    }

    Bytes signed_tx;
    try {
      signed_tx = signer_->SignTransaction(arb_tx);
    } catch (const std::exception& e) {
      Logger::Error("Error signing arb tx of size " + std::to_string(size) + ": " + e.what());
      continue;
    }

    std::vector<BundleTx> body{BundleTx::FromHash(tx_hash), BundleTx::FromSigned(std::move(signed_tx), false)};
    // Valid from the next block.
    bundles.push_back(BundleRequest::MakeSimple(block_number + 1, std::move(body), bundle_options_));
    Logger::Debug("Built bundle of size " + std::to_string(size) + " for block " + std::to_string(block_number + 1));
  }
  return bundles;
}

#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "engine/types.hpp"
#include "matchmaker/types.hpp"
#include "node_connection/node_client.hpp"
#include "strategy/blind_arb.hpp"
#include "strategy/pool_table.hpp"
#include "strategy/types.hpp"

// Backruns mev-share hints that touch a known Uniswap v3 pool with a ladder
// of v2/v3 arbitrage bundles of increasing size.
class MevShareUniArb : public Strategy<Event, Action> {
public:
  // Wei of WETH borrowed per rung: 1e5 .. 1e18.
  static constexpr std::array<uint64_t, 14> kLadderSizes = {
    100'000ULL, 1'000'000ULL, 10'000'000ULL, 100'000'000ULL,
    1'000'000'000ULL, 10'000'000'000ULL, 100'000'000'000ULL,
    1'000'000'000'000ULL, 10'000'000'000'000ULL, 100'000'000'000'000ULL,
    1'000'000'000'000'000ULL, 10'000'000'000'000'000ULL,
    100'000'000'000'000'000ULL, 1'000'000'000'000'000'000ULL,
  };
  static constexpr uint64_t kPayoutPercentage = 40;
  static constexpr unsigned long long kArbGasLimit = 400'000;

  MevShareUniArb(std::shared_ptr<NodeClient> node,
                 std::shared_ptr<const TransactionSigner> signer,
                 std::unique_ptr<ArbContract> arb_contract,
                 std::string pools_csv,
                 BundleOptions bundle_options = BundleOptions::Default());

  void SyncState() override;
  std::optional<Action> ProcessEvent(const Event& event) override;
  std::string Name() const override { return "mev-share-uni-arb"; }

  // One bundle per ladder rung that could be filled and signed, each
  // [target tx hash, signed arb tx] targeting the next block.
  std::vector<BundleRequest> GenerateBundles(const std::string& v3_pool, const std::string& tx_hash);

  const PoolTable& Pools() const { return pools_; }

private:
  std::optional<Action> OnMevShareEvent(const MevShareEvent& event);

  std::shared_ptr<NodeClient> node_;
  std::shared_ptr<const TransactionSigner> signer_;
  std::unique_ptr<ArbContract> arb_contract_;
  std::string pools_csv_;
  BundleOptions bundle_options_;
  PoolTable pools_;
};

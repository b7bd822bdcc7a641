#pragma once
#include <cstdint>
#include <string>
#include "wallet/signer.hpp"

// ABI encoding for the BlindArb flash-loan contract.
namespace BlindArbABI {
  // keccak256("makeFlashLoan(address[],uint256[],bytes)")[0:4]
  const Bytes& MakeFlashLoanSelector();

  struct ArbParams {
    bool weth_token0 = false;
    std::string v2_pool;
    std::string v3_pool;
    uint64_t size = 0; // wei of WETH borrowed
    uint64_t payout_percentage = 0;
  };

  // abi.encode((bool,address,address,uint256,uint256))
  Bytes EncodeUserData(const ArbParams& p);

  // makeFlashLoan([token], [amount], userData)
  Bytes BuildMakeFlashLoanCalldata(const std::string& token, uint64_t amount, const Bytes& user_data);
}

// Call builder for an on-chain arbitrage contract. Returns an unsigned,
// unfilled transaction: no gas, nonce or chain id.
class ArbContract {
public:
  virtual ~ArbContract() = default;
  virtual TransactionFields BuildArbitrageCall(const std::string& v2_pool,
                                               const std::string& v3_pool,
                                               uint64_t size,
                                               uint64_t payout_percentage,
                                               bool weth_token0) const = 0;
};

// Borrows WETH from the Balancer vault and arbitrages the v2/v3 pair.
class BlindArbContract : public ArbContract {
public:
  explicit BlindArbContract(const std::string& contract_address);
  TransactionFields BuildArbitrageCall(const std::string& v2_pool,
                                       const std::string& v3_pool,
                                       uint64_t size,
                                       uint64_t payout_percentage,
                                       bool weth_token0) const override;
  const std::string& Address() const { return address_; }
private:
  std::string address_;
};

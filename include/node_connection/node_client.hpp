#pragma once
#include "wallet/signer.hpp"

// The slice of an Ethereum node the strategy depends on. Every call is a
// network round-trip and throws RpcError on failure.
class NodeClient {
public:
  virtual ~NodeClient() = default;
  virtual unsigned long long GetGasPrice() = 0;
  virtual unsigned long long GetBlockNumber() = 0;
  // Fills chain id, sender and nonce where unset; gas fields already set are kept.
  virtual void FillTransaction(TransactionFields& tx) = 0;
};

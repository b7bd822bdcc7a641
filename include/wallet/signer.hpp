#pragma once
#include <optional>
#include <string>
#include <vector>
#include "utils/hex.hpp"

// EIP-1559 transaction. nonce and chain_id stay empty until the node fills them.
struct TransactionFields {
  std::optional<unsigned long long> chain_id;
  std::optional<unsigned long long> nonce;
  std::string from; // 0x..., informational; signing derives it from the key
  unsigned long long gas_limit = 0;
  unsigned long long max_fee_per_gas = 0; // wei
  unsigned long long max_priority_fee_per_gas = 0; // wei
  std::string to; // 0x...
  unsigned long long value = 0; // wei
  Bytes data;

  // Legacy-style single price: used as both fee cap and tip.
  void SetGasPrice(unsigned long long wei) { max_fee_per_gas = wei; max_priority_fee_per_gas = wei; }
};

// "Sign this transaction, get signed bytes."
class TransactionSigner {
public:
  virtual ~TransactionSigner() = default;
  // Throws std::invalid_argument when the transaction is not fully filled.
  virtual Bytes SignTransaction(const TransactionFields& tx) const = 0;
  virtual std::string Address() const = 0;
};

// secp256k1 key held in memory. Immutable after construction, so a single
// instance is shared read-only by every relay client and the strategy.
class Signer : public TransactionSigner {
public:
  explicit Signer(const std::string& private_key_hex);
  // Typed 0x02 envelope: 0x02 || rlp([..., y_parity, r, s])
  Bytes SignTransaction(const TransactionFields& tx) const override;
  std::string SignEip1559(const TransactionFields& tx) const { return BytesToHex0x(SignTransaction(tx)); }
  // EIP-191 personal_sign over `message`, 65 bytes r || s || v (v = 27/28)
  Bytes SignPersonalMessage(const std::string& message) const;
  std::string Address() const override { return address_; }
private:
  Bytes priv_;
  std::string address_;
};

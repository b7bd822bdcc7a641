#include "wallet/signer.hpp"
#include "crypto/keccak.hpp"
#include "crypto/secp256k1.hpp"
#include "encoding/rlp.hpp"
#include <stdexcept>

Signer::Signer(const std::string& private_key_hex) {
  if (!IsHexOfLength(private_key_hex, 32)) throw std::invalid_argument("private key must be 32 bytes of hex");
  priv_ = HexToBytes(private_key_hex);
  if (!Crypto::IsValidPrivateKey(priv_)) throw std::invalid_argument("private key is outside the secp256k1 range");
  address_ = Crypto::AddressFromPublicKey(Crypto::PublicKeyFromPrivate(priv_));
}

Bytes Signer::SignTransaction(const TransactionFields& tx) const {
  if (!tx.chain_id) throw std::invalid_argument("transaction has no chain id");
  if (!tx.nonce) throw std::invalid_argument("transaction has no nonce");
  if (tx.gas_limit == 0) throw std::invalid_argument("transaction has no gas limit");
  if (!IsHexOfLength(tx.to, 20)) throw std::invalid_argument("transaction has no valid recipient");
  // RLP: [chainId, nonce, maxPriorityFeePerGas, maxFeePerGas, gasLimit, to, value, data, accessList]
  std::vector<Bytes> core{
    RLP::EncodeUint(*tx.chain_id),
    RLP::EncodeUint(*tx.nonce),
    RLP::EncodeUint(tx.max_priority_fee_per_gas),
    RLP::EncodeUint(tx.max_fee_per_gas),
    RLP::EncodeUint(tx.gas_limit),
    RLP::EncodeString(tx.to),
    RLP::EncodeUint(tx.value),
    RLP::EncodeBytes(tx.data),
    RLP::EncodeList({})
  };
  // sighash = keccak256(0x02 || rlp_core)
  Bytes preimage{0x02};
  auto rlp_core = RLP::EncodeList(core);
  preimage.insert(preimage.end(), rlp_core.begin(), rlp_core.end());
  auto sig = Crypto::SignDigest(priv_, Crypto::Keccak256(preimage));

  std::vector<Bytes> full = core;
  full.push_back(RLP::EncodeUint(static_cast<unsigned long long>(sig.recovery_id)));
  full.push_back(RLP::EncodeBigEndian(sig.r));
  full.push_back(RLP::EncodeBigEndian(sig.s));
  auto rlp_full = RLP::EncodeList(full);
  Bytes out{0x02};
  out.insert(out.end(), rlp_full.begin(), rlp_full.end());
  return out;
}

Bytes Signer::SignPersonalMessage(const std::string& message) const {
  return Crypto::SignDigest(priv_, Crypto::PersonalMessageDigest(message)).ToRsv();
}

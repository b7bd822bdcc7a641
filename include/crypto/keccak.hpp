#pragma once
#include <string>
#include "utils/hex.hpp"

namespace Crypto {
  // 32-byte keccak256 digest (the pre-standard padding Ethereum uses, not SHA3-256)
  Bytes Keccak256(const unsigned char* data, size_t len);
  Bytes Keccak256(const Bytes& data);
  // 0x-prefixed hex digest of the raw bytes of `text`
  std::string Keccak256Hex(const std::string& text);

  // keccak256(signature)[0:4], e.g. "transfer(address,uint256)" -> a9059cbb
  Bytes FunctionSelector(const std::string& signature);

  // EIP-191: keccak256("\x19Ethereum Signed Message:\n" || len(message) || message)
  Bytes PersonalMessageDigest(const std::string& message);

  // Last 20 bytes of keccak256(X || Y) for a 65-byte uncompressed key.
  std::string AddressFromPublicKey(const Bytes& uncompressed);
}

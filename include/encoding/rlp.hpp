#pragma once
#include <string>
#include <vector>
#include "utils/hex.hpp"

// Recursive-length-prefix encoding. Every function returns the encoded item
// as raw bytes; lists take already-encoded items.
namespace RLP {
  Bytes EncodeBytes(const Bytes& data);
  Bytes EncodeString(const std::string& hex0x);
  Bytes EncodeUint(unsigned long long value);
  // Big-endian unsigned integer of arbitrary width; leading zeros are stripped.
  Bytes EncodeBigEndian(const Bytes& be);
  Bytes EncodeList(const std::vector<Bytes>& elements);
}

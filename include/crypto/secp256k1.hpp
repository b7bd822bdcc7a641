#pragma once
#include "utils/hex.hpp"

namespace Crypto {
  struct RecoverableSignature {
    Bytes r;             // 32 bytes, big-endian
    Bytes s;             // 32 bytes, big-endian, low-s
    int recovery_id = 0; // 0 or 1, the y-parity of a typed transaction

    // r || s || v with v = 27 + recovery_id, as personal_sign returns it
    Bytes ToRsv() const;
  };

  bool IsValidPrivateKey(const Bytes& priv32);
  // Deterministic (RFC6979) signature over a 32-byte digest.
  RecoverableSignature SignDigest(const Bytes& priv32, const Bytes& digest32);
  // 65 bytes: 0x04 || X || Y
  Bytes PublicKeyFromPrivate(const Bytes& priv32);
}

#include "crypto/keccak.hpp"
#include <stdexcept>
#include <cryptopp/keccak.h>

namespace Crypto {
  Bytes Keccak256(const unsigned char* data, size_t len) {
    Bytes digest(CryptoPP::Keccak_256::DIGESTSIZE);
    CryptoPP::Keccak_256().CalculateDigest(digest.data(), data, len);
    return digest;
  }

  Bytes Keccak256(const Bytes& data) { return Keccak256(data.data(), data.size()); }

  std::string Keccak256Hex(const std::string& text) {
    return BytesToHex0x(Keccak256(reinterpret_cast<const unsigned char*>(text.data()), text.size()));
  }

  Bytes FunctionSelector(const std::string& signature) {
    Bytes hash = Keccak256(reinterpret_cast<const unsigned char*>(signature.data()), signature.size());
    hash.resize(4);
    return hash;
  }

  Bytes PersonalMessageDigest(const std::string& message) {
    const std::string prefix = "\x19" "Ethereum Signed Message:\n" + std::to_string(message.size());
    CryptoPP::Keccak_256 hash;
    hash.Update(reinterpret_cast<const unsigned char*>(prefix.data()), prefix.size());
    hash.Update(reinterpret_cast<const unsigned char*>(message.data()), message.size());
    Bytes digest(CryptoPP::Keccak_256::DIGESTSIZE);
    hash.Final(digest.data());
    return digest;
  }

  std::string AddressFromPublicKey(const Bytes& uncompressed) {
    if (uncompressed.size() != 65 || uncompressed[0] != 0x04)
      throw std::invalid_argument("expected a 65-byte uncompressed public key");
    Bytes hash = Keccak256(uncompressed.data() + 1, 64);
    return BytesToHex0x(hash.data() + 12, 20);
  }
}

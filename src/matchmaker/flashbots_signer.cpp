#include "matchmaker/flashbots_signer.hpp"
#include "crypto/keccak.hpp"
#include "wallet/signer.hpp"
#include <stdexcept>

FlashbotsSigner::FlashbotsSigner(std::shared_ptr<const Signer> signer) : signer_(std::move(signer)) {
  if (!signer_) throw std::invalid_argument("FlashbotsSigner requires a signer");
}

std::string FlashbotsSigner::HeaderValue(const std::string& body) const {
  std::string body_hash = Crypto::Keccak256Hex(body);
  auto sig = signer_->SignPersonalMessage(body_hash);
  return signer_->Address() + ":" + BytesToHex0x(sig);
}

void FlashbotsSigner::Apply(const std::string& body, std::unordered_map<std::string, std::string>& headers) const {
  headers[kHeaderName] = HeaderValue(body);
}

std::string FlashbotsSigner::Address() const { return signer_->Address(); }

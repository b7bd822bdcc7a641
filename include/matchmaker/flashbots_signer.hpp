#pragma once
#include <memory>
#include <string>
#include <unordered_map>

class Signer;

// Relay authentication: every request body is signed by the searcher's
// reputation key and carried in the X-Flashbots-Signature header.
class FlashbotsSigner {
public:
  static constexpr const char* kHeaderName = "X-Flashbots-Signature";

  explicit FlashbotsSigner(std::shared_ptr<const Signer> signer);

  // "<address>:0x<65-byte personal_sign of the 0x-hex keccak256 of body>"
  std::string HeaderValue(const std::string& body) const;
  void Apply(const std::string& body, std::unordered_map<std::string, std::string>& headers) const;
  std::string Address() const;

private:
  std::shared_ptr<const Signer> signer_;
};

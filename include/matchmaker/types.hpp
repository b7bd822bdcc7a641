#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "utils/hex.hpp"

// Wire types of the MEV-share matchmaker API (mev_sendBundle).

enum class ProtocolVersion {
  kBeta1, // "beta-1", the default
  kV0_1   // "v0.1"
};

// Data used by block builders to check if the bundle should be considered for inclusion.
struct Inclusion {
  unsigned long long block = 0;                // first valid block
  std::optional<unsigned long long> max_block; // last valid block
};

// A bundle body element: the transaction being backrun (by hash) or a new
// signed transaction.
struct BundleTx {
  struct TxHash {
    std::string hash;
  };
  struct Tx {
    Bytes tx;                 // signed transaction bytes
    bool can_revert = false;  // if true the bundle stays valid when this tx reverts
  };

  std::variant<TxHash, Tx> value;

  static BundleTx FromHash(const std::string& hash) { return BundleTx{TxHash{hash}}; }
  static BundleTx FromSigned(Bytes tx, bool can_revert) { return BundleTx{Tx{std::move(tx), can_revert}}; }
  const TxHash* AsHash() const { return std::get_if<TxHash>(&value); }
  const Tx* AsTx() const { return std::get_if<Tx>(&value); }
};

// Minimum percent of a bundle's earnings to redistribute for inclusion.
struct Refund {
  unsigned long long body_idx = 0;
  unsigned long long percent = 0;
};

// Which address receives what percent of the refund when this bundle is
// enveloped by another one.
struct RefundConfig {
  std::string address;
  unsigned long long percent = 0;
};

struct Validity {
  std::optional<std::vector<Refund>> refund;
  std::optional<std::vector<RefundConfig>> refund_config;
};

// What the matchmaker may share about the bundle's transactions. Serialized
// as an array of tags in a fixed order.
class PrivacyHint {
public:
  PrivacyHint& WithCalldata() { calldata_ = true; return *this; }
  PrivacyHint& WithContractAddress() { contract_address_ = true; return *this; }
  PrivacyHint& WithLogs() { logs_ = true; return *this; }
  PrivacyHint& WithFunctionSelector() { function_selector_ = true; return *this; }
  PrivacyHint& WithHash() { hash_ = true; return *this; }
  PrivacyHint& WithTxHash() { tx_hash_ = true; return *this; }

  bool HasCalldata() const { return calldata_; }
  bool HasContractAddress() const { return contract_address_; }
  bool HasLogs() const { return logs_; }
  bool HasFunctionSelector() const { return function_selector_; }
  bool HasHash() const { return hash_; }
  bool HasTxHash() const { return tx_hash_; }

  std::vector<std::string> ToTags() const;
  // Throws std::invalid_argument on an unknown tag.
  static PrivacyHint FromTags(const std::vector<std::string>& tags);

  bool operator==(const PrivacyHint& o) const;
  bool operator!=(const PrivacyHint& o) const { return !(*this == o); }

private:
  bool calldata_ = false;
  bool contract_address_ = false;
  bool logs_ = false;
  bool function_selector_ = false;
  bool hash_ = false;
  bool tx_hash_ = false;
};

struct Privacy {
  std::optional<PrivacyHint> hints;
  std::optional<std::vector<std::string>> builders; // builder addresses allowed to see the bundle
};

// Per-bundle preferences applied by BundleRequest::Make.
struct BundleOptions {
  std::optional<std::vector<RefundConfig>> refund_config;
  std::optional<Privacy> privacy;

  // Hints off, disclosure limited to the trusted builder list.
  static BundleOptions Default();
};

struct BundleRequest {
  ProtocolVersion version = ProtocolVersion::kBeta1;
  Inclusion inclusion;
  std::vector<BundleTx> body;
  std::optional<Validity> validity;
  std::optional<Privacy> privacy;

  static BundleRequest Make(unsigned long long block,
                            std::optional<unsigned long long> max_block,
                            ProtocolVersion version,
                            std::vector<BundleTx> body,
                            const BundleOptions& options);
  // Valid from `block` through block + kSimpleBundleWindow.
  static BundleRequest MakeSimple(unsigned long long block, std::vector<BundleTx> body,
                                  const BundleOptions& options = BundleOptions::Default());
};

inline constexpr unsigned long long kSimpleBundleWindow = 30;

struct SendBundleResponse {
  std::string bundle_hash;
};

const char* ProtocolVersionName(ProtocolVersion v);

bool operator==(const Inclusion& a, const Inclusion& b);
bool operator==(const BundleTx& a, const BundleTx& b);
bool operator==(const Refund& a, const Refund& b);
bool operator==(const RefundConfig& a, const RefundConfig& b);
bool operator==(const Validity& a, const Validity& b);
bool operator==(const Privacy& a, const Privacy& b);
bool operator==(const BundleRequest& a, const BundleRequest& b);

// nlohmann::json conversions. Decoding throws nlohmann::json::exception or
// std::invalid_argument on malformed input.
void to_json(nlohmann::json& j, const ProtocolVersion& v);
void from_json(const nlohmann::json& j, ProtocolVersion& v);
void to_json(nlohmann::json& j, const Inclusion& v);
void from_json(const nlohmann::json& j, Inclusion& v);
void to_json(nlohmann::json& j, const BundleTx& v);
void from_json(const nlohmann::json& j, BundleTx& v);
void to_json(nlohmann::json& j, const Refund& v);
void from_json(const nlohmann::json& j, Refund& v);
void to_json(nlohmann::json& j, const RefundConfig& v);
void from_json(const nlohmann::json& j, RefundConfig& v);
void to_json(nlohmann::json& j, const Validity& v);
void from_json(const nlohmann::json& j, Validity& v);
void to_json(nlohmann::json& j, const PrivacyHint& v);
void from_json(const nlohmann::json& j, PrivacyHint& v);
void to_json(nlohmann::json& j, const Privacy& v);
void from_json(const nlohmann::json& j, Privacy& v);
void to_json(nlohmann::json& j, const BundleRequest& v);
void from_json(const nlohmann::json& j, BundleRequest& v);
void to_json(nlohmann::json& j, const SendBundleResponse& v);
void from_json(const nlohmann::json& j, SendBundleResponse& v);

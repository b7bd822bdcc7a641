#include "matchmaker/types.hpp"
#include "constants/mainnet.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace {
unsigned long long QuantityFromJson(const json& j) {
  if (j.is_number_unsigned()) return j.get<unsigned long long>();
  if (j.is_string()) return ParseHexQuantity(j.get<std::string>());
  throw std::invalid_argument("expected hex quantity, got " + j.dump());
}

template <typename T>
void PutOptional(json& j, const char* key, const std::optional<T>& v) {
  if (v) j[key] = *v;
}

template <typename T>
void GetOptional(const json& j, const char* key, std::optional<T>& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) { out.reset(); return; }
  out = it->get<T>();
}
}

const char* ProtocolVersionName(ProtocolVersion v) {
  switch (v) {
    case ProtocolVersion::kBeta1: return "beta-1";
    case ProtocolVersion::kV0_1: return "v0.1";
  }
  return "beta-1";
}

std::vector<std::string> PrivacyHint::ToTags() const {
  std::vector<std::string> tags;
  if (calldata_) tags.emplace_back("calldata");
  if (contract_address_) tags.emplace_back("contract_address");
  if (logs_) tags.emplace_back("logs");
  if (function_selector_) tags.emplace_back("function_selector");
  if (hash_) tags.emplace_back("hash");
  if (tx_hash_) tags.emplace_back("tx_hash");
  return tags;
}

PrivacyHint PrivacyHint::FromTags(const std::vector<std::string>& tags) {
  PrivacyHint hint;
  for (const auto& tag : tags) {
    if (tag == "calldata") hint.calldata_ = true;
    else if (tag == "contract_address") hint.contract_address_ = true;
    else if (tag == "logs") hint.logs_ = true;
    else if (tag == "function_selector") hint.function_selector_ = true;
    else if (tag == "hash") hint.hash_ = true;
    else if (tag == "tx_hash") hint.tx_hash_ = true;
    else throw std::invalid_argument("invalid privacy hint: " + tag);
  }
  return hint;
}

bool PrivacyHint::operator==(const PrivacyHint& o) const {
  return calldata_ == o.calldata_ && contract_address_ == o.contract_address_ && logs_ == o.logs_ &&
         function_selector_ == o.function_selector_ && hash_ == o.hash_ && tx_hash_ == o.tx_hash_;
}

BundleOptions BundleOptions::Default() {
  BundleOptions opts;
  Privacy privacy;
  privacy.hints = PrivacyHint{};
  privacy.builders = MainnetConstants::TRUSTED_BUILDERS;
  opts.privacy = privacy;
  return opts;
}

BundleRequest BundleRequest::Make(unsigned long long block,
                                  std::optional<unsigned long long> max_block,
                                  ProtocolVersion version,
                                  std::vector<BundleTx> body,
                                  const BundleOptions& options) {
  BundleRequest req;
  req.version = version;
  req.inclusion.block = block;
  req.inclusion.max_block = max_block;
  req.body = std::move(body);
  if (options.refund_config) {
    Validity validity;
    validity.refund_config = options.refund_config;
    req.validity = validity;
  }
  req.privacy = options.privacy;
  return req;
}

BundleRequest BundleRequest::MakeSimple(unsigned long long block, std::vector<BundleTx> body,
                                        const BundleOptions& options) {
  return Make(block, block + kSimpleBundleWindow, ProtocolVersion::kBeta1, std::move(body), options);
}

bool operator==(const Inclusion& a, const Inclusion& b) {
  return a.block == b.block && a.max_block == b.max_block;
}

bool operator==(const BundleTx& a, const BundleTx& b) {
  if (a.value.index() != b.value.index()) return false;
  if (auto* h = a.AsHash()) return h->hash == b.AsHash()->hash;
  auto* ta = a.AsTx();
  auto* tb = b.AsTx();
  return ta->tx == tb->tx && ta->can_revert == tb->can_revert;
}

bool operator==(const Refund& a, const Refund& b) {
  return a.body_idx == b.body_idx && a.percent == b.percent;
}

bool operator==(const RefundConfig& a, const RefundConfig& b) {
  return a.address == b.address && a.percent == b.percent;
}

bool operator==(const Validity& a, const Validity& b) {
  return a.refund == b.refund && a.refund_config == b.refund_config;
}

bool operator==(const Privacy& a, const Privacy& b) {
  return a.hints == b.hints && a.builders == b.builders;
}

bool operator==(const BundleRequest& a, const BundleRequest& b) {
  return a.version == b.version && a.inclusion == b.inclusion && a.body == b.body &&
         a.validity == b.validity && a.privacy == b.privacy;
}

void to_json(json& j, const ProtocolVersion& v) { j = ProtocolVersionName(v); }

void from_json(const json& j, ProtocolVersion& v) {
  auto s = j.get<std::string>();
  if (s == "beta-1") v = ProtocolVersion::kBeta1;
  else if (s == "v0.1") v = ProtocolVersion::kV0_1;
  else throw std::invalid_argument("unknown protocol version: " + s);
}

void to_json(json& j, const Inclusion& v) {
  j = json{{"block", ToHexQuantity(v.block)}};
  if (v.max_block) j["maxBlock"] = ToHexQuantity(*v.max_block);
}

void from_json(const json& j, Inclusion& v) {
  v.block = QuantityFromJson(j.at("block"));
  auto it = j.find("maxBlock");
  if (it != j.end() && !it->is_null()) v.max_block = QuantityFromJson(*it);
  else v.max_block.reset();
}

void to_json(json& j, const BundleTx& v) {
  if (auto* h = v.AsHash()) {
    j = json{{"hash", h->hash}};
  } else {
    auto* t = v.AsTx();
    j = json{{"tx", BytesToHex0x(t->tx)}, {"canRevert", t->can_revert}};
  }
}

// Untagged: the member present decides the variant.
void from_json(const json& j, BundleTx& v) {
  if (j.contains("hash")) {
    v.value = BundleTx::TxHash{NormalizeHash(j.at("hash").get<std::string>())};
  } else if (j.contains("tx")) {
    v.value = BundleTx::Tx{HexToBytes(j.at("tx").get<std::string>()), j.at("canRevert").get<bool>()};
  } else {
    throw std::invalid_argument("bundle body element has neither hash nor tx: " + j.dump());
  }
}

void to_json(json& j, const Refund& v) { j = json{{"bodyIdx", v.body_idx}, {"percent", v.percent}}; }

void from_json(const json& j, Refund& v) {
  v.body_idx = j.at("bodyIdx").get<unsigned long long>();
  v.percent = j.at("percent").get<unsigned long long>();
}

void to_json(json& j, const RefundConfig& v) { j = json{{"address", v.address}, {"percent", v.percent}}; }

void from_json(const json& j, RefundConfig& v) {
  v.address = j.at("address").get<std::string>();
  v.percent = j.at("percent").get<unsigned long long>();
}

void to_json(json& j, const Validity& v) {
  j = json::object();
  PutOptional(j, "refund", v.refund);
  PutOptional(j, "refundConfig", v.refund_config);
}

void from_json(const json& j, Validity& v) {
  GetOptional(j, "refund", v.refund);
  GetOptional(j, "refundConfig", v.refund_config);
}

void to_json(json& j, const PrivacyHint& v) { j = v.ToTags(); }

void from_json(const json& j, PrivacyHint& v) { v = PrivacyHint::FromTags(j.get<std::vector<std::string>>()); }

void to_json(json& j, const Privacy& v) {
  j = json::object();
  PutOptional(j, "hints", v.hints);
  PutOptional(j, "builders", v.builders);
}

void from_json(const json& j, Privacy& v) {
  GetOptional(j, "hints", v.hints);
  GetOptional(j, "builders", v.builders);
}

void to_json(json& j, const BundleRequest& v) {
  j = json{{"version", v.version}, {"inclusion", v.inclusion}, {"body", v.body}};
  PutOptional(j, "validity", v.validity);
  PutOptional(j, "privacy", v.privacy);
}

void from_json(const json& j, BundleRequest& v) {
  auto it = j.find("version");
  v.version = (it == j.end() || it->is_null()) ? ProtocolVersion::kBeta1 : it->get<ProtocolVersion>();
  v.inclusion = j.at("inclusion").get<Inclusion>();
  v.body = j.at("body").get<std::vector<BundleTx>>();
  GetOptional(j, "validity", v.validity);
  GetOptional(j, "privacy", v.privacy);
}

void to_json(json& j, const SendBundleResponse& v) { j = json{{"bundleHash", v.bundle_hash}}; }

void from_json(const json& j, SendBundleResponse& v) { v.bundle_hash = j.at("bundleHash").get<std::string>(); }

#include "config/app_config.hpp"
#include <stdexcept>
#include "common/config_manager.hpp"
#include "constants/mainnet.hpp"
#include "utils/hex.hpp"

namespace {
std::string RequirePrivateKey(const std::string& key) {
  std::string value = ConfigManager::GetOrThrow(key);
  if (!IsHexOfLength(value, 32)) throw std::invalid_argument(key + " must be a 32-byte hex private key");
  return value;
}
}

BundleOptions AppConfig::BuildBundleOptions() const {
  BundleOptions opts = BundleOptions::Default();
  if (!privacy_builders.empty()) opts.privacy->builders = privacy_builders;
  if (refund) opts.refund_config = std::vector<RefundConfig>{*refund};
  return opts;
}

LogSettings LoadLogSettings() {
  LogSettings s;
  s.file = ConfigManager::Get("LOG_FILE").value_or("");
  s.level = Logger::ParseLogLevel(ConfigManager::Get("LOG_LEVEL").value_or("info"));
  return s;
}

AppConfig LoadAppConfig() {
  AppConfig cfg;
  cfg.chain_id = ParseChain(ConfigManager::Get("CHAIN").value_or("mainnet"));
  cfg.rpc_url = ConfigManager::GetOrThrow("RPC_URL");
  if (auto a = ConfigManager::Get("RPC_AUTH_HEADER")) cfg.rpc_auth_header = *a;
  cfg.private_key = RequirePrivateKey("PRIVATE_KEY");
  cfg.flashbots_signer_key = RequirePrivateKey("FLASHBOTS_SIGNER");
  cfg.arb_contract_address = NormalizeAddress(ConfigManager::GetOrThrow("ARB_CONTRACT_ADDRESS"));
  cfg.pools_csv = ConfigManager::Get("POOLS_CSV").value_or(cfg.pools_csv);
  cfg.mev_share_sse_url = ConfigManager::Get("MEV_SHARE_SSE_URL").value_or(MainnetConstants::MEV_SHARE_SSE_URL);

  if (auto list = ConfigManager::Get("RELAY_URLS")) {
    cfg.relays = ParseRelayList(*list);
    if (cfg.relays.empty()) throw std::invalid_argument("RELAY_URLS is set but lists no relays");
  } else {
    cfg.relays = RelayRegistryForChain(cfg.chain_id);
  }

  if (auto refund_to = ConfigManager::Get("REFUND_ADDRESS")) {
    int percent = ConfigManager::GetIntOr("REFUND_PERCENT", 30);
    if (percent < 0 || percent > 100) throw std::invalid_argument("REFUND_PERCENT must be within 0..100");
    cfg.refund = RefundConfig{NormalizeAddress(*refund_to), static_cast<unsigned long long>(percent)};
  }
  for (const auto& b : ConfigManager::GetListOr("PRIVACY_BUILDERS", {})) {
    cfg.privacy_builders.push_back(NormalizeAddress(b));
  }

  cfg.fail_fast = ConfigManager::GetBoolOr("FAIL_FAST", false);
  cfg.metrics_file = ConfigManager::Get("METRICS_FILE").value_or("");
  cfg.http_timeout_ms = ConfigManager::GetIntOr("HTTP_TIMEOUT_MS", cfg.http_timeout_ms);
  cfg.rpc_timeout_ms = ConfigManager::GetIntOr("RPC_TIMEOUT_MS", cfg.rpc_timeout_ms);
  if (cfg.http_timeout_ms <= 0 || cfg.rpc_timeout_ms <= 0) throw std::invalid_argument("timeouts must be positive");
  return cfg;
}

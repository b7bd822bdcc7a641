#pragma once
#include <optional>
#include <string>
#include <vector>
#include "common/logger.hpp"
#include "matchmaker/types.hpp"
#include "net/multi_relay.hpp"

struct LogSettings {
  std::string file;  // empty: no file sink
  LogLevel level = LogLevel::INFO;
};

// LOG_FILE and LOG_LEVEL only. Read before the logger starts, so warnings
// from the rest of the configuration reach it.
LogSettings LoadLogSettings();

struct AppConfig {
  unsigned long long chain_id = 1;
  std::string rpc_url;
  std::optional<std::string> rpc_auth_header;
  std::string private_key;           // signs arbitrage transactions
  std::string flashbots_signer_key;  // authenticates relay requests
  std::string arb_contract_address;
  std::string pools_csv = "resources/v3_v2_pools.csv";
  std::string mev_share_sse_url;
  std::vector<RelayEndpoint> relays;
  std::optional<RefundConfig> refund;
  std::vector<std::string> privacy_builders;
  bool fail_fast = false;
  std::string metrics_file;
  int http_timeout_ms = 5000;
  int rpc_timeout_ms = 2000;

  // Privacy and refund preferences applied to every generated bundle.
  BundleOptions BuildBundleOptions() const;
};

// Reads every other setting through ConfigManager. Throws std::runtime_error for a
// missing required key and std::invalid_argument for a malformed value.
AppConfig LoadAppConfig();

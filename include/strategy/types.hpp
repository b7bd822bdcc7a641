#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "matchmaker/types.hpp"

// A log emitted by a pending transaction, as far as the matchmaker reveals it.
struct LogEntry {
  std::string address; // normalized 0x lower-case
  std::vector<std::string> topics;
  std::string data;
};

struct PendingTxInfo {
  std::optional<std::string> to;
  std::optional<std::string> function_selector;
  std::optional<std::string> call_data;
};

// One hint from the mev-share event stream. Fields the user chose not to
// disclose arrive empty.
struct MevShareEvent {
  std::string hash;
  std::vector<LogEntry> logs;
  std::vector<PendingTxInfo> txs;
};

void from_json(const nlohmann::json& j, LogEntry& l);
void from_json(const nlohmann::json& j, PendingTxInfo& t);
void from_json(const nlohmann::json& j, MevShareEvent& e);

// Throws nlohmann::json::exception or std::invalid_argument on a malformed payload.
MevShareEvent ParseMevShareEvent(const std::string& data);

struct SubmitBundles {
  std::vector<BundleRequest> bundles;
};

using Event = std::variant<MevShareEvent>;
using Action = std::variant<SubmitBundles>;

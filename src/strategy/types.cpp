#include "strategy/types.hpp"
#include "utils/hex.hpp"

namespace {
// null and absent are the same thing on this stream
bool Present(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  return it != j.end() && !it->is_null();
}

std::optional<std::string> OptionalString(const nlohmann::json& j, const char* key) {
  if (!Present(j, key)) return std::nullopt;
  return j.at(key).get<std::string>();
}
}

void from_json(const nlohmann::json& j, LogEntry& l) {
  l.address = NormalizeAddress(j.at("address").get<std::string>());
  l.topics.clear();
  if (Present(j, "topics")) {
    for (const auto& t : j.at("topics")) l.topics.push_back(ToLowerHex(t.get<std::string>()));
  }
  l.data = Present(j, "data") ? j.at("data").get<std::string>() : std::string();
}

void from_json(const nlohmann::json& j, PendingTxInfo& t) {
  t.to = OptionalString(j, "to");
  if (t.to) t.to = NormalizeAddress(*t.to);
  t.function_selector = OptionalString(j, "functionSelector");
  t.call_data = OptionalString(j, "callData");
}

void from_json(const nlohmann::json& j, MevShareEvent& e) {
  e.hash = NormalizeHash(j.at("hash").get<std::string>());
  e.logs = Present(j, "logs") ? j.at("logs").get<std::vector<LogEntry>>() : std::vector<LogEntry>{};
  e.txs = Present(j, "txs") ? j.at("txs").get<std::vector<PendingTxInfo>>() : std::vector<PendingTxInfo>{};
}

MevShareEvent ParseMevShareEvent(const std::string& data) {
  return nlohmann::json::parse(data).get<MevShareEvent>();
}

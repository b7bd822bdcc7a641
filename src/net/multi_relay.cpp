#include "net/multi_relay.hpp"
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include "constants/mainnet.hpp"
#include "utils/hex.hpp"

namespace {
std::string Trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}
}

bool operator==(const RelayEndpoint& a, const RelayEndpoint& b) {
  return a.name == b.name && a.url == b.url;
}

const std::vector<RelayEndpoint>& DefaultRelayRegistry() {
  static const std::vector<RelayEndpoint> relays = {
    {"flashbots", "https://relay.flashbots.net/"},
    {"builder0x69", "http://builder0x69.io/"},
    {"edennetwork", "https://api.edennetwork.io/v1/bundle"},
    {"beaverbuild", "https://rpc.beaverbuild.org/"},
    {"lightspeedbuilder", "https://rpc.lightspeedbuilder.info/"},
    {"eth-builder", "https://eth-builder.com/"},
    {"ultrasound", "https://relay.ultrasound.money/"},
    {"agnostic-relay", "https://agnostic-relay.net/"},
    {"relayoor-wtf", "https://relayooor.wtf/"},
    {"rsync-builder", "https://rsync-builder.xyz/"},
  };
  return relays;
}

std::vector<RelayEndpoint> RelayRegistryForChain(unsigned long long chain_id) {
  if (chain_id == static_cast<unsigned long long>(MainnetConstants::CHAIN_ID)) return DefaultRelayRegistry();
  if (chain_id == static_cast<unsigned long long>(MainnetConstants::GOERLI_CHAIN_ID))
    return {{"flashbots-goerli", MainnetConstants::GOERLI_RELAY_URL}};
  throw std::invalid_argument("no relay registry for chain id " + std::to_string(chain_id));
}

std::vector<RelayEndpoint> ParseRelayList(const std::string& list) {
  std::vector<RelayEndpoint> out;
  std::unordered_set<std::string> seen;
  std::stringstream ss(list);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = Trim(item);
    if (item.empty()) continue;
    auto eq = item.find('=');
    if (eq == std::string::npos) throw std::invalid_argument("relay entry without '=': " + item);
    RelayEndpoint ep{Trim(item.substr(0, eq)), Trim(item.substr(eq + 1))};
    if (ep.name.empty() || ep.url.empty()) throw std::invalid_argument("relay entry needs name=url: " + item);
    if (!seen.insert(ep.name).second) throw std::invalid_argument("duplicate relay name: " + ep.name);
    out.push_back(std::move(ep));
  }
  return out;
}

unsigned long long ParseChain(const std::string& name) {
  std::string n = ToLowerHex(Trim(name));
  if (n == "mainnet" || n == "ethereum") return MainnetConstants::CHAIN_ID;
  if (n == "goerli") return MainnetConstants::GOERLI_CHAIN_ID;
  if (!n.empty() && n.find_first_not_of("0123456789") == std::string::npos) {
    try {
      return std::stoull(n);
    } catch (const std::out_of_range&) {
      throw std::invalid_argument("chain id out of range: " + name);
    }
  }
  throw std::invalid_argument("unknown chain: " + name);
}

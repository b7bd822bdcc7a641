#pragma once
#include <string>
#include <vector>

// A bundle relay or builder accepting mev_sendBundle.
struct RelayEndpoint {
  std::string name;
  std::string url;
};

bool operator==(const RelayEndpoint& a, const RelayEndpoint& b);

// Mainnet relays every bundle is fanned out to, in submission order.
const std::vector<RelayEndpoint>& DefaultRelayRegistry();

// Mainnet: DefaultRelayRegistry(). Goerli: the Flashbots goerli relay only.
// Throws std::invalid_argument for any other chain id.
std::vector<RelayEndpoint> RelayRegistryForChain(unsigned long long chain_id);

// "name=url,name=url". Throws std::invalid_argument on an entry without a
// name or url, or a repeated name.
std::vector<RelayEndpoint> ParseRelayList(const std::string& list);

// "mainnet", "goerli" or a decimal chain id.
unsigned long long ParseChain(const std::string& name);

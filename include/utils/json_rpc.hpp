#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace JsonRpcUtil {
  // {"jsonrpc":"2.0","id":id,"method":method,"params":params}
  nlohmann::json BuildRequest(const std::string& method, nlohmann::json params, unsigned long long id = 1);
  // Returns the "result" member. Throws RpcError (kRelay) when the body carries
  // an "error" object and RpcError (kDecode) when it is not valid JSON-RPC.
  nlohmann::json ExtractResult(const std::string& json_body, const std::string& endpoint);
  // Result that must be a hex quantity string (eth_blockNumber, eth_gasPrice, ...)
  unsigned long long ExtractQuantity(const std::string& json_body, const std::string& endpoint);
  // Extract error message if present, empty otherwise
  std::string ExtractError(const std::string& json_body);
}

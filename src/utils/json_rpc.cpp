#include "utils/json_rpc.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"

using json = nlohmann::json;

namespace JsonRpcUtil {
  json BuildRequest(const std::string& method, json params, unsigned long long id) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}};
  }

  json ExtractResult(const std::string& body, const std::string& endpoint) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
      throw RpcError(RpcError::Kind::kDecode, endpoint, "response is not a JSON object");
    if (j.contains("error") && !j["error"].is_null()) {
      const auto& err = j["error"];
      std::string msg = err.is_object() && err.contains("message") && err["message"].is_string()
        ? err["message"].get<std::string>() : err.dump();
      throw RpcError(RpcError::Kind::kRelay, endpoint, msg);
    }
    if (!j.contains("result")) throw RpcError(RpcError::Kind::kDecode, endpoint, "missing result");
    return j["result"];
  }

  unsigned long long ExtractQuantity(const std::string& body, const std::string& endpoint) {
    auto result = ExtractResult(body, endpoint);
    if (!result.is_string()) throw RpcError(RpcError::Kind::kDecode, endpoint, "result is not a quantity");
    try {
      return ParseHexQuantity(result.get<std::string>());
    } catch (const std::invalid_argument& e) {
      throw RpcError(RpcError::Kind::kDecode, endpoint, e.what());
    }
  }

  std::string ExtractError(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("error") && !j["error"].is_null()) return j["error"].dump();
    return std::string();
  }
}

#include "matchmaker/client.hpp"
#include "common/errors.hpp"
#include "net/http_client.hpp"
#include "utils/json_rpc.hpp"
#include <atomic>

namespace {
std::atomic<unsigned long long> g_request_id{1};
}

MatchmakerClient::MatchmakerClient(HttpClient& http,
                                   std::shared_ptr<const Signer> auth_signer,
                                   const std::string& url,
                                   const std::string& relay_name,
                                   int timeout_ms)
  : http_(http), signer_(std::move(auth_signer)), url_(url), name_(relay_name), timeout_ms_(timeout_ms) {}

nlohmann::json MatchmakerClient::Call(const std::string& method, nlohmann::json params) const {
  std::string body = JsonRpcUtil::BuildRequest(method, std::move(params), g_request_id.fetch_add(1)).dump();

  std::unordered_map<std::string, std::string> headers{{"Content-Type", "application/json"}};
  signer_.Apply(body, headers);

  auto resp = http_.Post(url_, body, headers, timeout_ms_);
  if (resp.status == 0) throw RpcError(RpcError::Kind::kTransport, name_, resp.error);
  if (resp.status < 200 || resp.status >= 300) {
    // Relays often reject with a 4xx carrying a JSON-RPC error object.
    std::string detail = JsonRpcUtil::ExtractError(resp.body);
    if (!detail.empty())
      throw RpcError(RpcError::Kind::kRelay, name_, "HTTP " + std::to_string(resp.status) + " " + detail);
    throw RpcError(RpcError::Kind::kTransport, name_, "HTTP " + std::to_string(resp.status));
  }
  return JsonRpcUtil::ExtractResult(resp.body, name_);
}

SendBundleResponse MatchmakerClient::SendBundle(const BundleRequest& bundle) const {
  auto result = Call("mev_sendBundle", nlohmann::json::array({bundle}));
  try {
    return result.get<SendBundleResponse>();
  } catch (const nlohmann::json::exception& e) {
    throw RpcError(RpcError::Kind::kDecode, name_, std::string("bad mev_sendBundle result: ") + e.what());
  }
}

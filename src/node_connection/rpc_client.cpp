#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "utils/json_rpc.hpp"
#include <cctype>

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

// "Name: value" sets that header; a bare value goes to Authorization.
static void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                            const std::optional<std::string>& auth_header_opt) {
  if (!auth_header_opt) return;
  const std::string& raw = *auth_header_opt;
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty() && name.find(' ') == std::string::npos) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::string& default_sender,
                     const std::optional<std::string>& auth_header,
                     int timeout_ms)
  : http_(http), endpoint_(endpoint_url), default_sender_(default_sender), timeout_ms_(timeout_ms) {
  default_headers_["Content-Type"] = "application/json";
  ApplyAuthHeader(default_headers_, auth_header);
}

std::string RpcClient::Send(const std::string& method, nlohmann::json params) {
  unsigned long long id;
  {
    std::lock_guard<std::mutex> lock(id_mutex_);
    id = next_id_++;
  }
  auto payload = JsonRpcUtil::BuildRequest(method, std::move(params), id).dump();
  auto resp = http_.Post(endpoint_, payload, default_headers_, timeout_ms_);
  if (resp.status == 0)
    throw RpcError(RpcError::Kind::kTransport, endpoint_, method + ": " + resp.error);
  if (resp.status < 200 || resp.status >= 300)
    throw RpcError(RpcError::Kind::kTransport, endpoint_, method + ": HTTP " + std::to_string(resp.status));
  return resp.body;
}

nlohmann::json RpcClient::Call(const std::string& method, nlohmann::json params) {
  return JsonRpcUtil::ExtractResult(Send(method, std::move(params)), endpoint_);
}

unsigned long long RpcClient::CallQuantity(const std::string& method, nlohmann::json params) {
  return JsonRpcUtil::ExtractQuantity(Send(method, std::move(params)), endpoint_);
}

unsigned long long RpcClient::EthBlockNumber() {
  return CallQuantity("eth_blockNumber", nlohmann::json::array());
}

unsigned long long RpcClient::EthGasPrice() {
  return CallQuantity("eth_gasPrice", nlohmann::json::array());
}

unsigned long long RpcClient::EthChainId() {
  std::lock_guard<std::mutex> lock(chain_id_mutex_);
  if (!chain_id_) chain_id_ = CallQuantity("eth_chainId", nlohmann::json::array());
  return *chain_id_;
}

unsigned long long RpcClient::EthGetTransactionCount(const std::string& address, const std::string& block_tag) {
  return CallQuantity("eth_getTransactionCount", nlohmann::json::array({address, block_tag}));
}

// Every ladder rung is an alternative to the others, so each one takes the
// account's current pending nonce rather than reserving a fresh one.
void RpcClient::FillTransaction(TransactionFields& tx) {
  if (tx.from.empty()) tx.from = default_sender_;
  if (!tx.chain_id) tx.chain_id = EthChainId();
  if (!tx.nonce) tx.nonce = EthGetTransactionCount(tx.from, "pending");
  if (tx.max_fee_per_gas == 0) tx.SetGasPrice(EthGasPrice());
}

#pragma once
#include <string>
#include <optional>
#include <mutex>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "node_connection/node_client.hpp"

class HttpClient;

// JSON-RPC client for an Ethereum node over HTTP.
class RpcClient : public NodeClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::string& default_sender,
            const std::optional<std::string>& auth_header = std::nullopt,
            int timeout_ms = 2000);

  // Sends one request and returns its "result"; throws RpcError.
  nlohmann::json Call(const std::string& method, nlohmann::json params);

  unsigned long long EthBlockNumber();
  unsigned long long EthGasPrice();
  unsigned long long EthChainId();
  unsigned long long EthGetTransactionCount(const std::string& address, const std::string& block_tag = "pending");

  unsigned long long GetGasPrice() override { return EthGasPrice(); }
  unsigned long long GetBlockNumber() override { return EthBlockNumber(); }
  void FillTransaction(TransactionFields& tx) override;

  const std::string& Endpoint() const { return endpoint_; }
private:
  // Posts one request and returns the 2xx body; throws RpcError (kTransport).
  std::string Send(const std::string& method, nlohmann::json params);
  unsigned long long CallQuantity(const std::string& method, nlohmann::json params);

  HttpClient& http_;
  std::string endpoint_;
  std::string default_sender_;
  int timeout_ms_;
  std::unordered_map<std::string, std::string> default_headers_;
  std::mutex chain_id_mutex_;
  std::optional<unsigned long long> chain_id_;
  unsigned long long next_id_ = 1;
  std::mutex id_mutex_;
};

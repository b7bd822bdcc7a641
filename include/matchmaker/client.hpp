#pragma once
#include <memory>
#include <string>
#include "matchmaker/flashbots_signer.hpp"
#include "matchmaker/types.hpp"

class HttpClient;
class Signer;

// JSON-RPC client bound to one relay. Every outbound request is signed with
// the relay-authentication key. Not retried: retry policy is the caller's.
class MatchmakerClient {
public:
  MatchmakerClient(HttpClient& http,
                   std::shared_ptr<const Signer> auth_signer,
                   const std::string& url,
                   const std::string& relay_name,
                   int timeout_ms = 5000);

  // Signed JSON-RPC request; returns "result". Throws RpcError.
  nlohmann::json Call(const std::string& method, nlohmann::json params) const;

  // mev_sendBundle with a single positional parameter. Throws RpcError.
  SendBundleResponse SendBundle(const BundleRequest& bundle) const;

  const std::string& Name() const { return name_; }
  const std::string& Url() const { return url_; }

private:
  HttpClient& http_;
  FlashbotsSigner signer_;
  std::string url_;
  std::string name_;
  int timeout_ms_;
};

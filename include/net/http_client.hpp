#pragma once
#include <memory>
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0;      // 0 when no HTTP response was received
  std::string body;
  std::string error;    // transport error text when status == 0
};

// Thread-safe: one client instance is shared by every relay executor.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

// Optional tuning knobs for persistent HTTP client behavior
struct HttpClientTuning {
  bool enable_http2 = true;      // try HTTP/2 when TLS is used
  bool enable_tcp_keepalive = true;
  int tcp_keepidle_s = 30;
  int tcp_keepintvl_s = 15;
  int connect_timeout_ms = 3000;
  std::string user_agent = "backrunner/1.0";
};

// Factory for a libcurl-based client.
std::unique_ptr<HttpClient> CreateCurlHttpClient(const HttpClientTuning& tuning = HttpClientTuning{});

// curl_global_init is not thread-safe; every curl user calls this first.
void EnsureCurlGlobalInit();

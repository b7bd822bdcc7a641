#include "net/http_client.hpp"
#include <stdexcept>
#include "common/logger.hpp"
#include "net/curl_easy.hpp"

namespace {
size_t AppendBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
  return size * nmemb;
}

// Stateless between calls: every Post builds its own handle, so the relay
// executors can share one client.
class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(const HttpClientTuning& tuning) : tuning_(tuning) { EnsureCurlGlobalInit(); }

  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const std::unordered_map<std::string, std::string>& headers,
                    int timeout_ms) override {
    HttpResponse resp;
    try {
      CurlEasy easy;
      for (const auto& kv : headers) easy.AddHeader(kv.first + ": " + kv.second);
      easy.ApplyTuning(tuning_);

      std::string received;
      CURL* curl = easy.get();
      curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
      curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, AppendBody);
      curl_easy_setopt(curl, CURLOPT_WRITEDATA, &received);
      curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));

      CURLcode rc = easy.Perform();
      if (rc != CURLE_OK) {
        resp.error = curl_easy_strerror(rc);
        Logger::Debug("POST " + url + " failed: " + resp.error);
        return resp;
      }
      resp.status = easy.ResponseCode();
      resp.body = std::move(received);
    } catch (const std::runtime_error& e) {
      resp.error = e.what();
      Logger::Error("POST " + url + ": " + resp.error);
    }
    return resp;
  }

private:
  HttpClientTuning tuning_;
};
}

std::unique_ptr<HttpClient> CreateCurlHttpClient(const HttpClientTuning& tuning) {
  return std::make_unique<CurlHttpClient>(tuning);
}

#include "net/curl_easy.hpp"
#include <mutex>
#include <stdexcept>

void EnsureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlEasy::CurlEasy() {
  EnsureCurlGlobalInit();
  curl_ = curl_easy_init();
  if (!curl_) throw std::runtime_error("curl_easy_init failed");
  curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
}

CurlEasy::~CurlEasy() {
  if (headers_) curl_slist_free_all(headers_);
  curl_easy_cleanup(curl_);
}

void CurlEasy::AddHeader(const std::string& line) {
  curl_slist* next = curl_slist_append(headers_, line.c_str());
  if (!next) throw std::runtime_error("curl_slist_append failed");
  headers_ = next;
}

void CurlEasy::ApplyTuning(const HttpClientTuning& tuning) {
  curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(tuning.connect_timeout_ms));
  curl_easy_setopt(curl_, CURLOPT_USERAGENT, tuning.user_agent.c_str());
  curl_easy_setopt(curl_, CURLOPT_TCP_KEEPALIVE, tuning.enable_tcp_keepalive ? 1L : 0L);
  if (tuning.enable_tcp_keepalive) {
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPIDLE, static_cast<long>(tuning.tcp_keepidle_s));
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPINTVL, static_cast<long>(tuning.tcp_keepintvl_s));
  }
  if (tuning.enable_http2) curl_easy_setopt(curl_, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

CURLcode CurlEasy::Perform() {
  curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
  return curl_easy_perform(curl_);
}

long CurlEasy::ResponseCode() const {
  long code = 0;
  curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &code);
  return code;
}

#pragma once
#include <string>
#include <curl/curl.h>
#include "net/http_client.hpp"

// One libcurl easy handle plus its request header list, released together.
// A handle serves one transfer on one thread.
class CurlEasy {
public:
  // Throws std::runtime_error when libcurl cannot allocate a handle.
  CurlEasy();
  ~CurlEasy();
  CurlEasy(const CurlEasy&) = delete;
  CurlEasy& operator=(const CurlEasy&) = delete;

  CURL* get() const { return curl_; }
  void AddHeader(const std::string& line);
  // Connection preferences shared by request/response and streaming use.
  void ApplyTuning(const HttpClientTuning& tuning);
  // Installs the header list and runs the transfer.
  CURLcode Perform();
  long ResponseCode() const;

private:
  CURL* curl_ = nullptr;
  curl_slist* headers_ = nullptr;
};

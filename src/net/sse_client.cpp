#include "net/sse_client.hpp"
#include "net/curl_easy.hpp"
#include <stdexcept>
#include <utility>

void SseParser::Reset() {
  line_buf_.clear();
  event_.clear();
  data_.clear();
  id_.clear();
  has_data_ = false;
}

void SseParser::Feed(const char* data, size_t len, std::vector<SseMessage>& out) {
  for (size_t i = 0; i < len; ++i) {
    char c = data[i];
    if (c == '\n') {
      if (!line_buf_.empty() && line_buf_.back() == '\r') line_buf_.pop_back();
      HandleLine(line_buf_, out);
      line_buf_.clear();
    } else {
      line_buf_.push_back(c);
    }
  }
}

void SseParser::HandleLine(const std::string& line, std::vector<SseMessage>& out) {
  if (line.empty()) {
    if (has_data_) {
      out.push_back(SseMessage{event_.empty() ? "message" : event_, data_, id_});
    }
    event_.clear();
    data_.clear();
    has_data_ = false;
    return;
  }
  if (line[0] == ':') return;
  auto colon = line.find(':');
  std::string field = line.substr(0, colon);
  std::string value;
  if (colon != std::string::npos) {
    value = line.substr(colon + 1);
    if (!value.empty() && value[0] == ' ') value.erase(0, 1);
  }
  if (field == "data") {
    if (has_data_) data_.push_back('\n');
    data_ += value;
    has_data_ = true;
  } else if (field == "event") {
    event_ = value;
  } else if (field == "id") {
    id_ = value;
  }
}

namespace {
struct StreamContext {
  CURL* curl = nullptr;
  SseParser parser;
  std::vector<SseMessage> pending;
  const SseClient::OnOpenFn* on_open = nullptr;
  const SseClient::OnMessageFn* on_message = nullptr;
  const std::atomic<bool>* stop = nullptr;
  SseResult result;
};

size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* ctx = static_cast<StreamContext*>(userdata);
  size_t n = size * nitems;
  // Blank line ends one header block; redirects produce several.
  if (n <= 2 && (n == 0 || buffer[0] == '\r' || buffer[0] == '\n')) {
    long code = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
    if (code >= 300 && code < 400) return n;
    ctx->result.status = code;
    ctx->result.opened = code >= 200 && code < 300;
    if (*ctx->on_open) (*ctx->on_open)(code);
  }
  return n;
}

size_t BodyCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* ctx = static_cast<StreamContext*>(userdata);
  size_t n = size * nmemb;
  if (!ctx->result.opened) return 0;
  ctx->parser.Feed(ptr, n, ctx->pending);
  for (auto& msg : ctx->pending) (*ctx->on_message)(msg);
  ctx->pending.clear();
  return n;
}

int ProgressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto* ctx = static_cast<StreamContext*>(userdata);
  return ctx->stop->load(std::memory_order_relaxed) ? 1 : 0;
}
}

SseClient::SseClient(std::string url, HttpClientTuning tuning)
  : url_(std::move(url)), tuning_(std::move(tuning)) {}

SseResult SseClient::Run(const OnOpenFn& on_open, const OnMessageFn& on_message, const std::atomic<bool>& stop) {
  StreamContext ctx;
  ctx.on_open = &on_open;
  ctx.on_message = &on_message;
  ctx.stop = &stop;
  try {
    CurlEasy easy;
    ctx.curl = easy.get();
    easy.AddHeader("Accept: text/event-stream");
    easy.AddHeader("Cache-Control: no-cache");
    easy.ApplyTuning(tuning_);
    curl_easy_setopt(ctx.curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(ctx.curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(ctx.curl, CURLOPT_FOLLOWLOCATION, 1L);
    // A silent stream for two minutes is treated as a dead connection.
    curl_easy_setopt(ctx.curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(ctx.curl, CURLOPT_LOW_SPEED_TIME, 120L);
    curl_easy_setopt(ctx.curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(ctx.curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(ctx.curl, CURLOPT_WRITEFUNCTION, BodyCallback);
    curl_easy_setopt(ctx.curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(ctx.curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(ctx.curl, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
    curl_easy_setopt(ctx.curl, CURLOPT_XFERINFODATA, &ctx);

    CURLcode rc = easy.Perform();
    if (rc != CURLE_OK && !(rc == CURLE_ABORTED_BY_CALLBACK && stop.load())) {
      if (rc == CURLE_WRITE_ERROR && !ctx.result.opened) {
        ctx.result.error = "unexpected HTTP status " + std::to_string(ctx.result.status);
      } else {
        ctx.result.error = curl_easy_strerror(rc);
      }
    }
  } catch (const std::runtime_error& e) {
    ctx.result.error = e.what();
  }
  return ctx.result;
}

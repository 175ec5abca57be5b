#include "HttpClient.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <exception>
#include <memory>
#include <mutex>

#include "logger.hpp"

namespace remote {

namespace {

std::once_flag curl_init_flag;

struct CurlEasyDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
struct CurlSlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct TransferState {
  CURL* curl = nullptr;
  HttpResponseHandler* handler = nullptr;
  bool headersDelivered = false;
  bool aborted = false;
  std::exception_ptr error;
};

// 首次拿到响应体之前，状态码和 Content-Length 已经可读
bool deliverHeaders(TransferState& state) {
  if (state.headersDelivered) return true;
  state.headersDelivered = true;

  long status = 0;
  curl_easy_getinfo(state.curl, CURLINFO_RESPONSE_CODE, &status);
  curl_off_t length = -1;
  curl_easy_getinfo(state.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);

  std::optional<uint64_t> contentLength;
  if (length >= 0) contentLength = static_cast<uint64_t>(length);
  return state.handler->onHeaders(status, contentLength);
}

// 回调里的异常不能穿过 libcurl，先保存，perform 返回后再抛
size_t write_data(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* state = static_cast<TransferState*>(userdata);
  size_t total = size * nmemb;
  try {
    if (!deliverHeaders(*state) || !state->handler->onBody(ptr, total)) {
      state->aborted = true;
      return 0;
    }
  } catch (...) {
    state->error = std::current_exception();
    return 0;
  }
  return total;
}

int transfer_info(void* userdata, curl_off_t, curl_off_t, curl_off_t,
                  curl_off_t) {
  auto* state = static_cast<TransferState*>(userdata);
  try {
    if (!state->handler->onProgressTick()) {
      state->aborted = true;
      return 1;
    }
  } catch (...) {
    state->error = std::current_exception();
    return 1;
  }
  return 0;
}

}  // namespace

CurlHttpClient::CurlHttpClient(CurlOptions options)
    : options_(std::move(options)) {
  std::call_once(curl_init_flag,
                 []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

void CurlHttpClient::get(const std::string& url,
                         const std::vector<std::string>& headers,
                         HttpResponseHandler& handler) {
  std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
  if (!curl) {
    throw RemoteAccessError(RemoteReason::Transport,
                            "curl_easy_init failed for " + url);
  }

  std::unique_ptr<curl_slist, CurlSlistDeleter> headerList;
  for (const auto& header : headers) {
    curl_slist* appended = curl_slist_append(headerList.get(), header.c_str());
    if (!appended) {
      throw RemoteAccessError(RemoteReason::Transport,
                              "curl_slist_append failed");
    }
    headerList.release();
    headerList.reset(appended);
  }

  TransferState state;
  state.curl = curl.get();
  state.handler = &handler;

  char errorBuffer[CURL_ERROR_SIZE] = {0};
  long bufferSize = static_cast<long>(
      std::clamp<size_t>(options_.receiveBufferSize, 1024, 512 * 1024));

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.userAgent.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION,
                   options_.followRedirects ? 1L : 0L);
  curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, bufferSize);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_data);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, transfer_info);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &state);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  LOG(DEBUG) << "[Http] GET " << url;
  CURLcode res = curl_easy_perform(curl.get());

  if (state.error) std::rethrow_exception(state.error);

  if (res == CURLE_OK) {
    // 空响应体时 write_data 不会被调用
    if (!deliverHeaders(state)) state.aborted = true;
    return;
  }
  if (state.aborted &&
      (res == CURLE_WRITE_ERROR || res == CURLE_ABORTED_BY_CALLBACK)) {
    LOG(DEBUG) << "[Http] Transfer stopped by handler: " << url;
    return;
  }

  std::string detail = errorBuffer[0] ? errorBuffer : curl_easy_strerror(res);
  LOG(WARN) << "[Http] GET " << url << " failed: " << detail;
  throw RemoteAccessError(RemoteReason::Transport,
                          "HTTP request failed: " + detail);
}

namespace {

class TextCollector : public HttpResponseHandler {
 public:
  explicit TextCollector(HttpTextResponse& out) : out_(out) {}

  bool onHeaders(long status, std::optional<uint64_t> contentLength) override {
    out_.status = status;
    if (contentLength) out_.body.reserve(static_cast<size_t>(*contentLength));
    return true;
  }
  bool onBody(const char* data, size_t length) override {
    out_.body.append(data, length);
    return true;
  }

 private:
  HttpTextResponse& out_;
};

}  // namespace

HttpTextResponse fetchText(HttpClient& client, const std::string& url,
                           const std::vector<std::string>& headers) {
  HttpTextResponse response;
  TextCollector collector(response);
  client.get(url, headers, collector);
  return response;
}

}  // namespace remote

#include "UrlUtils.hpp"

#include <curl/curl.h>

#include <memory>

#include "RemoteAccessError.hpp"

namespace remote {

namespace {

struct CurlUrlDeleter {
  void operator()(CURLU* url) const { curl_url_cleanup(url); }
};
struct CurlEasyDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

std::unique_ptr<CURLU, CurlUrlDeleter> parseUrl(const std::string& url) {
  std::unique_ptr<CURLU, CurlUrlDeleter> handle(curl_url());
  if (!handle) {
    throw RemoteAccessError(RemoteReason::InvalidUrl, "curl_url failed");
  }
  CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
  if (rc != CURLUE_OK) {
    throw RemoteAccessError(RemoteReason::InvalidUrl,
                            "invalid URL '" + url + "' (CURLUcode " +
                                std::to_string(static_cast<int>(rc)) + ")");
  }
  return handle;
}

std::string urlString(CURLU* handle) {
  char* out = nullptr;
  if (curl_url_get(handle, CURLUPART_URL, &out, 0) != CURLUE_OK || !out) {
    throw RemoteAccessError(RemoteReason::InvalidUrl,
                            "unable to render URL");
  }
  std::string result(out);
  curl_free(out);
  return result;
}

}  // namespace

std::string joinUrl(const std::string& base, const std::string& pathAndQuery) {
  auto handle = parseUrl(base);
  // 已有 URL 时设置相对地址，libcurl 会按 RFC 3986 解析
  CURLUcode rc =
      curl_url_set(handle.get(), CURLUPART_URL, pathAndQuery.c_str(), 0);
  if (rc != CURLUE_OK) {
    throw RemoteAccessError(RemoteReason::InvalidUrl,
                            "cannot join '" + pathAndQuery + "' onto " + base);
  }
  return urlString(handle.get());
}

std::string urlEncode(const std::string& text) {
  std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
  if (!curl) {
    throw RemoteAccessError(RemoteReason::Transport, "curl_easy_init failed");
  }
  char* escaped = curl_easy_escape(curl.get(), text.c_str(),
                                   static_cast<int>(text.size()));
  if (!escaped) {
    throw RemoteAccessError(RemoteReason::InvalidUrl,
                            "curl_easy_escape failed");
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

std::string normalizeUrl(const std::string& url) {
  auto handle = parseUrl(url);
  return urlString(handle.get());
}

}  // namespace remote

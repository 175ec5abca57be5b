#ifndef HTTP_CLIENT_HPP_
#define HTTP_CLIENT_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "RemoteAccessError.hpp"

namespace remote {

/**
 * @brief 一次 GET 请求的回调接收方
 *
 * onHeaders 在第一段响应体之前调用一次（空响应体时在请求结束后调用），
 * 之后每收到一段数据调用一次 onBody。任一回调返回 false 都会中止传输，
 * 中止不算错误，get() 正常返回。
 */
class HttpResponseHandler {
 public:
  virtual ~HttpResponseHandler() = default;

  virtual bool onHeaders(long status,
                         std::optional<uint64_t> contentLength) = 0;
  virtual bool onBody(const char* data, size_t length) = 0;
  // 传输期间周期性调用（包括没有数据到达的时候）
  virtual bool onProgressTick() { return true; }
};

class HttpClient {
 public:
  virtual ~HttpClient() = default;

  // 传输层失败抛出 RemoteAccessError(Transport)；
  // 回调中抛出的异常在请求结束后原样重新抛出。
  virtual void get(const std::string& url,
                   const std::vector<std::string>& headers,
                   HttpResponseHandler& handler) = 0;
};

struct CurlOptions {
  std::string userAgent = "DropDownloader/1.0";
  size_t receiveBufferSize = 64 * 1024;
  bool followRedirects = true;
};

class CurlHttpClient : public HttpClient {
 public:
  explicit CurlHttpClient(CurlOptions options = CurlOptions());

  void get(const std::string& url, const std::vector<std::string>& headers,
           HttpResponseHandler& handler) override;

 private:
  CurlOptions options_;
};

struct HttpTextResponse {
  long status = 0;
  std::string body;
};

// 读取完整响应体（用于 JSON 之类的小响应）
HttpTextResponse fetchText(HttpClient& client, const std::string& url,
                           const std::vector<std::string>& headers = {});

}  // namespace remote

#endif  // HTTP_CLIENT_HPP_

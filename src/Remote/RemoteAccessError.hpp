#ifndef REMOTE_ACCESS_ERROR_HPP_
#define REMOTE_ACCESS_ERROR_HPP_

#include <stdexcept>
#include <string>

namespace remote {

enum class RemoteReason {
  InvalidStatus,    // 非 200 状态码
  InvalidResponse,  // 缺少 Content-Length 等必要的响应元数据
  Transport,        // libcurl 层面的失败（DNS、连接、读超时…）
  MalformedBody,    // 响应体无法解析
  InvalidUrl
};

inline const char* remoteReasonName(RemoteReason reason) {
  switch (reason) {
    case RemoteReason::InvalidStatus:
      return "InvalidStatus";
    case RemoteReason::InvalidResponse:
      return "InvalidResponse";
    case RemoteReason::Transport:
      return "Transport";
    case RemoteReason::MalformedBody:
      return "MalformedBody";
    case RemoteReason::InvalidUrl:
      return "InvalidUrl";
  }
  return "Unknown";
}

// 与服务器通信失败。InvalidStatus 时 httpStatus() 为服务器返回的状态码。
class RemoteAccessError : public std::runtime_error {
 public:
  RemoteAccessError(RemoteReason reason, const std::string& detail,
                    long httpStatus = 0)
      : std::runtime_error(detail), reason_(reason), httpStatus_(httpStatus) {}

  RemoteReason reason() const { return reason_; }
  long httpStatus() const { return httpStatus_; }

 private:
  RemoteReason reason_;
  long httpStatus_;
};

}  // namespace remote

#endif  // REMOTE_ACCESS_ERROR_HPP_

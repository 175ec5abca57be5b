#ifndef DOWNLOAD_ERROR_HPP_
#define DOWNLOAD_ERROR_HPP_

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

#include "RemoteAccessError.hpp"

namespace downloads {

/**
 * @brief 单个下载任务失败的原因
 *
 * Communication：服务器返回非 200、缺少 Content-Length、传输失败、响应体损坏；
 * Io：本地文件的创建、定位、写入、权限设置失败；
 * Checksum：写入内容的 MD5 与清单不一致。
 */
class DownloadError : public std::runtime_error {
 public:
  enum class Kind { Communication, Io, Checksum };

  static DownloadError communication(const remote::RemoteAccessError& cause);
  static DownloadError io(const std::string& detail);
  static DownloadError checksum(const std::string& fileName, size_t chunkIndex,
                                const std::string& expected,
                                const std::string& actual);

  Kind kind() const { return kind_; }
  // 仅 Communication 有值
  std::optional<remote::RemoteReason> remoteReason() const {
    return remoteReason_;
  }
  long httpStatus() const { return httpStatus_; }

 private:
  DownloadError(Kind kind, const std::string& message);

  Kind kind_;
  std::optional<remote::RemoteReason> remoteReason_;
  long httpStatus_ = 0;
};

const char* downloadErrorKindName(DownloadError::Kind kind);

std::ostream& operator<<(std::ostream& os, const DownloadError& error);

}  // namespace downloads

#endif  // DOWNLOAD_ERROR_HPP_

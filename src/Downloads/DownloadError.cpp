#include "DownloadError.hpp"

namespace downloads {

DownloadError::DownloadError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

DownloadError DownloadError::communication(
    const remote::RemoteAccessError& cause) {
  DownloadError error(Kind::Communication,
                      std::string("communication error (") +
                          remote::remoteReasonName(cause.reason()) +
                          "): " + cause.what());
  error.remoteReason_ = cause.reason();
  error.httpStatus_ = cause.httpStatus();
  return error;
}

DownloadError DownloadError::io(const std::string& detail) {
  return DownloadError(Kind::Io, "io error: " + detail);
}

DownloadError DownloadError::checksum(const std::string& fileName,
                                      size_t chunkIndex,
                                      const std::string& expected,
                                      const std::string& actual) {
  return DownloadError(Kind::Checksum,
                       "checksum mismatch for " + fileName + " chunk " +
                           std::to_string(chunkIndex) + ": expected " +
                           expected + ", got " + actual);
}

const char* downloadErrorKindName(DownloadError::Kind kind) {
  switch (kind) {
    case DownloadError::Kind::Communication:
      return "Communication";
    case DownloadError::Kind::Io:
      return "Io";
    case DownloadError::Kind::Checksum:
      return "Checksum";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const DownloadError& error) {
  return os << "[" << downloadErrorKindName(error.kind()) << "] "
            << error.what();
}

}  // namespace downloads

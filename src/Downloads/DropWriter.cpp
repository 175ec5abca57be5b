#include "DropWriter.hpp"

#include <iomanip>
#include <sstream>

#include "DownloadError.hpp"

namespace downloads {

Md5Hasher::Md5Hasher() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
    throw DownloadError::io("unable to initialise MD5 context");
  }
}

void Md5Hasher::update(const char* data, size_t length) {
  if (finished_) throw DownloadError::io("MD5 context already finished");
  if (EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
    throw DownloadError::io("EVP_DigestUpdate failed");
  }
}

std::string Md5Hasher::finishHex() {
  if (finished_) throw DownloadError::io("MD5 context already finished");
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLength = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), digest, &digestLength) != 1) {
    throw DownloadError::io("EVP_DigestFinal_ex failed");
  }
  finished_ = true;

  std::ostringstream oss;
  for (unsigned int i = 0; i < digestLength; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(digest[i]);
  }
  return oss.str();
}

DropWriter::DropWriter(const std::filesystem::path& path, size_t bufferSize)
    : path_(path), buffer_(bufferSize > 0 ? bufferSize : 1) {
  // 缓冲区必须在 open 之前设置
  destination_.rdbuf()->pubsetbuf(buffer_.data(),
                                  static_cast<std::streamsize>(buffer_.size()));
  destination_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
  if (!destination_.is_open()) {
    std::ofstream create(path_, std::ios::binary | std::ios::app);
    if (!create) throw DownloadError::io("unable to create " + path_.string());
    create.close();
    destination_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
  }
  if (!destination_.is_open()) {
    throw DownloadError::io("unable to open " + path_.string());
  }
}

void DropWriter::seek(uint64_t offset) {
  destination_.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!destination_) {
    throw DownloadError::io("seek to " + std::to_string(offset) + " failed in " +
                            path_.string());
  }
}

void DropWriter::write(const char* data, size_t length) {
  destination_.write(data, static_cast<std::streamsize>(length));
  if (!destination_) {
    throw DownloadError::io("write failed in " + path_.string());
  }
  hasher_.update(data, length);
  written_ += length;
}

void DropWriter::flush() {
  destination_.flush();
  if (!destination_) {
    throw DownloadError::io("flush failed in " + path_.string());
  }
}

std::string DropWriter::finish() {
  flush();
  return hasher_.finishHex();
}

}  // namespace downloads

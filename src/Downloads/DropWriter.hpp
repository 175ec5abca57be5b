#ifndef DROP_WRITER_HPP_
#define DROP_WRITER_HPP_

#include <openssl/evp.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace downloads {

// EVP MD5 的 RAII 封装
class Md5Hasher {
 public:
  Md5Hasher();

  void update(const char* data, size_t length);
  // 返回小写十六进制摘要；之后不能再 update
  std::string finishHex();

 private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
  };
  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
  bool finished_ = false;
};

/**
 * @brief 写入目标文件的同时计算写入内容的 MD5
 *
 * 打开已存在的文件且不截断（分块写在各自的偏移上）；文件不存在时先创建。
 * 所有失败抛出 DownloadError(Io)。
 */
class DropWriter {
 public:
  DropWriter(const std::filesystem::path& path, size_t bufferSize);

  DropWriter(const DropWriter&) = delete;
  DropWriter& operator=(const DropWriter&) = delete;

  void seek(uint64_t offset);
  void write(const char* data, size_t length);
  void flush();
  // flush 后返回已写入字节的摘要
  std::string finish();

  uint64_t written() const { return written_; }
  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
  std::vector<char> buffer_;
  std::fstream destination_;
  Md5Hasher hasher_;
  uint64_t written_ = 0;
};

}  // namespace downloads

#endif  // DROP_WRITER_HPP_

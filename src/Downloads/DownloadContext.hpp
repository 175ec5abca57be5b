#ifndef DOWNLOAD_CONTEXT_HPP_
#define DOWNLOAD_CONTEXT_HPP_

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace downloads {

// 一次分块请求所需的全部信息，由 agent 根据清单生成，用完即弃
struct DropDownloadContext {
  std::string gameId;
  std::string version;
  std::string fileName;  // 清单中的相对路径
  size_t index = 0;      // 文件内的分块序号
  std::filesystem::path path;
  uint64_t offset = 0;
  uint32_t permissions = 0644;
  std::string checksum;  // 期望的 MD5（十六进制）
  uint64_t length = 0;   // 清单声明的分块长度
  bool finalChunk = false;
};

}  // namespace downloads

#endif  // DOWNLOAD_CONTEXT_HPP_

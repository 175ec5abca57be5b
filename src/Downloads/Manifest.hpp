#ifndef MANIFEST_HPP_
#define MANIFEST_HPP_

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "DownloadContext.hpp"

namespace downloads {

struct ChunkData {
  uint32_t permissions = 0644;
  std::vector<std::string> ids;
  std::vector<std::string> checksums;
  std::vector<uint64_t> lengths;
};

// 文件名 -> 分块信息
using DropManifest = std::map<std::string, ChunkData>;

// 解析 /api/v1/client/metadata/manifest 的响应体；
// 格式错误抛出 DownloadError(Communication, MalformedBody)
DropManifest parseManifest(const std::string& body);

// 按清单顺序生成每个分块的上下文，偏移量为同一文件内前序分块长度之和
std::vector<DropDownloadContext> generateContexts(
    const DropManifest& manifest, const std::string& gameId,
    const std::string& version, const std::filesystem::path& installDir);

uint64_t manifestTotalBytes(const DropManifest& manifest);

// 创建目录与文件并预分配到完整大小（TBB arena "allocate" 中并行执行）。
// 失败抛出 DownloadError(Io)
void allocateFiles(const DropManifest& manifest,
                   const std::filesystem::path& installDir);

}  // namespace downloads

#endif  // MANIFEST_HPP_

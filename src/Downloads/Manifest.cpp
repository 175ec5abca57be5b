#include "Manifest.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

#include "DownloadError.hpp"
#include "logger.hpp"
#include "tbb_manager.hpp"

namespace downloads {

namespace {

DownloadError malformed(const std::string& detail) {
  return DownloadError::communication(remote::RemoteAccessError(
      remote::RemoteReason::MalformedBody, "invalid manifest: " + detail));
}

// 清单里的文件名来自服务器，不允许跳出安装目录
bool isSafeRelativePath(const std::string& name) {
  std::filesystem::path p(name);
  if (name.empty() || p.is_absolute() || p.has_root_name()) return false;
  for (const auto& part : p) {
    if (part == "..") return false;
  }
  return true;
}

}  // namespace

DropManifest parseManifest(const std::string& body) {
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(body);
  } catch (const nlohmann::json::exception& e) {
    throw malformed(e.what());
  }
  if (!root.is_object()) throw malformed("expected an object");

  DropManifest manifest;
  for (const auto& item : root.items()) {
    const auto& entry = item.value();
    if (!isSafeRelativePath(item.key())) {
      throw malformed("unsafe file name '" + item.key() + "'");
    }
    ChunkData data;
    try {
      data.permissions = entry.at("permissions").get<uint32_t>();
      data.ids = entry.at("ids").get<std::vector<std::string>>();
      data.checksums = entry.at("checksums").get<std::vector<std::string>>();
      data.lengths = entry.at("lengths").get<std::vector<uint64_t>>();
    } catch (const nlohmann::json::exception& e) {
      throw malformed(item.key() + ": " + e.what());
    }
    if (data.checksums.size() != data.lengths.size()) {
      throw malformed(item.key() + ": " +
                      std::to_string(data.checksums.size()) +
                      " checksums for " + std::to_string(data.lengths.size()) +
                      " chunks");
    }
    manifest.emplace(item.key(), std::move(data));
  }
  return manifest;
}

std::vector<DropDownloadContext> generateContexts(
    const DropManifest& manifest, const std::string& gameId,
    const std::string& version, const std::filesystem::path& installDir) {
  std::vector<DropDownloadContext> contexts;
  for (const auto& kv : manifest) {
    const ChunkData& data = kv.second;
    uint64_t runningOffset = 0;
    for (size_t i = 0; i < data.lengths.size(); ++i) {
      DropDownloadContext ctx;
      ctx.gameId = gameId;
      ctx.version = version;
      ctx.fileName = kv.first;
      ctx.index = i;
      ctx.path = installDir / kv.first;
      ctx.offset = runningOffset;
      ctx.permissions = data.permissions;
      ctx.checksum = data.checksums[i];
      ctx.length = data.lengths[i];
      ctx.finalChunk = (i + 1 == data.lengths.size());
      runningOffset += data.lengths[i];
      contexts.push_back(std::move(ctx));
    }
  }
  return contexts;
}

uint64_t manifestTotalBytes(const DropManifest& manifest) {
  uint64_t total = 0;
  for (const auto& kv : manifest) {
    for (uint64_t length : kv.second.lengths) total += length;
  }
  return total;
}

void allocateFiles(const DropManifest& manifest,
                   const std::filesystem::path& installDir) {
  std::vector<std::pair<std::filesystem::path, uint64_t>> files;
  files.reserve(manifest.size());
  for (const auto& kv : manifest) {
    uint64_t size = 0;
    for (uint64_t length : kv.second.lengths) size += length;
    files.emplace_back(installDir / kv.first, size);
  }

  try {
    utils::TBBManager::GetInstance().ParallelFor<size_t>(
        "allocate", 0, files.size(), [&](size_t idx) {
          const auto& path = files[idx].first;
          const uint64_t size = files[idx].second;
          std::error_code ec;
          std::filesystem::create_directories(path.parent_path(), ec);
          if (ec) {
            throw DownloadError::io("create directory " +
                                    path.parent_path().string() + ": " +
                                    ec.message());
          }
          if (!std::filesystem::exists(path, ec)) {
            std::ofstream create(path, std::ios::binary);
            if (!create) throw DownloadError::io("create " + path.string());
          }
          // 已存在且大小一致的文件保持原样，暂停后恢复时不会丢数据
          if (std::filesystem::file_size(path, ec) != size || ec) {
            std::filesystem::resize_file(path, size, ec);
            if (ec) {
              throw DownloadError::io("resize " + path.string() + ": " +
                                      ec.message());
            }
          }
        });
  } catch (const DownloadError&) {
    throw;
  } catch (const std::exception& e) {
    throw DownloadError::io(std::string("allocate files: ") + e.what());
  }
  LOG(INFO) << "[Agent] Allocated " << files.size() << " files under "
            << installDir.string();
}

}  // namespace downloads

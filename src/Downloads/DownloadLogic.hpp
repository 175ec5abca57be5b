#ifndef DOWNLOAD_LOGIC_HPP_
#define DOWNLOAD_LOGIC_HPP_

#include <functional>
#include <string>

#include "ControlFlag.hpp"
#include "DownloadContext.hpp"
#include "DownloadPipeline.hpp"
#include "HttpClient.hpp"
#include "ProgressObject.hpp"

namespace downloads {

// 每次请求前调用，返回 Authorization 头的值
using AuthorizationProvider = std::function<std::string()>;

struct RemoteEndpoint {
  std::string baseUrl;
  AuthorizationProvider authorization;
};

std::string chunkUrl(const std::string& baseUrl,
                     const DropDownloadContext& ctx);

/**
 * @brief 下载单个分块：GET /api/v1/client/chunk，写入 ctx.path 的 ctx.offset 处
 *
 * 返回 true 表示分块完整写入且校验通过；返回 false 表示因 Stop 中途放弃。
 * 控制标志在开始前即为 Stop 时不会发出请求。
 * 失败抛出 DownloadError：非 200 或缺少 Content-Length 为 Communication，
 * 本地文件问题为 Io，MD5 不一致为 Checksum。
 */
bool downloadGameChunk(const DropDownloadContext& ctx,
                       const ControlHandle& control,
                       const ProgressHandle& progress,
                       remote::HttpClient& client,
                       const RemoteEndpoint& endpoint,
                       const PipelineOptions& options);

}  // namespace downloads

#endif  // DOWNLOAD_LOGIC_HPP_

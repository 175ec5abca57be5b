#include "DownloadLogic.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>

#include "DownloadError.hpp"
#include "UrlUtils.hpp"
#include "logger.hpp"

namespace downloads {

namespace {

constexpr size_t kMaxErrorBodyBytes = 4096;

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

// 把响应头的校验与响应体的拷贝接到 HttpClient 的回调上
class ChunkResponseHandler : public remote::HttpResponseHandler {
 public:
  ChunkResponseHandler(const DropDownloadContext& ctx, ControlHandle control,
                       ProgressHandle progress, const PipelineOptions& options)
      : ctx_(ctx),
        control_(std::move(control)),
        progress_(std::move(progress)),
        options_(options) {}

  bool onHeaders(long status, std::optional<uint64_t> contentLength) override {
    status_ = status;
    if (status != 200) {
      // 继续读取响应体，作为错误信息的一部分
      return true;
    }
    if (!contentLength) {
      missingLength_ = true;
      return false;
    }

    writer_ = std::make_unique<DropWriter>(ctx_.path, options_.writerBufferSize);
    if (ctx_.offset != 0) writer_->seek(ctx_.offset);
    pipeline_ = std::make_unique<DropDownloadPipeline>(
        *writer_, control_, progress_, *contentLength, options_);
    return true;
  }

  bool onBody(const char* data, size_t length) override {
    if (status_ != 200) {
      size_t room = kMaxErrorBodyBytes - std::min(kMaxErrorBodyBytes,
                                                  errorBody_.size());
      errorBody_.append(data, std::min(room, length));
      return true;
    }
    return pipeline_ && pipeline_->feed(data, length);
  }

  bool onProgressTick() override {
    if (pipeline_) return pipeline_->checkControl();
    if (control_->get() == ControlState::Stop) {
      stoppedEarly_ = true;
      return false;
    }
    return true;
  }

  long status() const { return status_; }
  bool missingLength() const { return missingLength_; }
  bool stopped() const {
    return stoppedEarly_ || (pipeline_ && pipeline_->stopped());
  }
  const std::string& errorBody() const { return errorBody_; }
  DropDownloadPipeline* pipeline() { return pipeline_.get(); }

 private:
  const DropDownloadContext& ctx_;
  ControlHandle control_;
  ProgressHandle progress_;
  const PipelineOptions& options_;

  long status_ = 0;
  bool missingLength_ = false;
  bool stoppedEarly_ = false;
  std::string errorBody_;
  std::unique_ptr<DropWriter> writer_;
  std::unique_ptr<DropDownloadPipeline> pipeline_;
};

void applyPermissions(const DropDownloadContext& ctx) {
#ifndef _WIN32
  std::error_code ec;
  std::filesystem::permissions(
      ctx.path, static_cast<std::filesystem::perms>(ctx.permissions & 07777),
      std::filesystem::perm_options::replace, ec);
  if (ec) {
    throw DownloadError::io("set permissions on " + ctx.path.string() + ": " +
                            ec.message());
  }
#else
  (void)ctx;
#endif
}

}  // namespace

std::string chunkUrl(const std::string& baseUrl,
                     const DropDownloadContext& ctx) {
  // 查询参数全部编码
  return remote::joinUrl(baseUrl, "/api/v1/client/chunk?id=" +
                                      remote::urlEncode(ctx.gameId) +
                                      "&version=" +
                                      remote::urlEncode(ctx.version) +
                                      "&name=" +
                                      remote::urlEncode(ctx.fileName) +
                                      "&chunk=" + std::to_string(ctx.index));
}

bool downloadGameChunk(const DropDownloadContext& ctx,
                       const ControlHandle& control,
                       const ProgressHandle& progress,
                       remote::HttpClient& client,
                       const RemoteEndpoint& endpoint,
                       const PipelineOptions& options) {
  // 已暂停
  if (control->get() == ControlState::Stop) return false;

  ChunkResponseHandler handler(ctx, control, progress, options);
  try {
    std::string url = chunkUrl(endpoint.baseUrl, ctx);
    std::vector<std::string> headers;
    if (endpoint.authorization) {
      headers.push_back("Authorization: " + endpoint.authorization());
    }
    client.get(url, headers, handler);
  } catch (const remote::RemoteAccessError& e) {
    throw DownloadError::communication(e);
  }

  if (handler.status() != 200) {
    LOG(WARN) << "[Pipeline] Chunk " << ctx.fileName << "#" << ctx.index
              << " returned HTTP " << handler.status() << ": "
              << handler.errorBody();
    throw DownloadError::communication(remote::RemoteAccessError(
        remote::RemoteReason::InvalidStatus,
        "HTTP " + std::to_string(handler.status()) + ": " + handler.errorBody(),
        handler.status()));
  }
  if (handler.missingLength()) {
    throw DownloadError::communication(remote::RemoteAccessError(
        remote::RemoteReason::InvalidResponse,
        "chunk response has no Content-Length"));
  }
  if (handler.stopped()) return false;

  DropDownloadPipeline* pipeline = handler.pipeline();
  if (!pipeline) {
    throw DownloadError::communication(remote::RemoteAccessError(
        remote::RemoteReason::InvalidResponse, "chunk response had no body"));
  }
  if (!pipeline->complete()) {
    throw DownloadError::communication(remote::RemoteAccessError(
        remote::RemoteReason::InvalidResponse,
        "short read: " + std::to_string(pipeline->copied()) + " of " +
            std::to_string(pipeline->size()) + " bytes"));
  }

  std::string checksum = pipeline->finish();
  if (!ctx.checksum.empty() && !equalsIgnoreCase(checksum, ctx.checksum)) {
    throw DownloadError::checksum(ctx.fileName, ctx.index, ctx.checksum,
                                  checksum);
  }

  // 文件最后一个分块完成后再设置权限
  if (ctx.finalChunk) applyPermissions(ctx);

  LOG(DEBUG) << "[Pipeline] Chunk " << ctx.fileName << "#" << ctx.index
             << " done (" << pipeline->copied() << " bytes)";
  return true;
}

}  // namespace downloads

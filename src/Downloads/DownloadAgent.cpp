#include "DownloadAgent.hpp"

#include "DownloadError.hpp"
#include "UrlUtils.hpp"
#include "logger.hpp"

namespace downloads {

DownloadAgent::DownloadAgent(std::string id, std::string version,
                             std::string targetDir,
                             std::shared_ptr<const AgentDependencies> deps)
    : id_(std::move(id)),
      version_(std::move(version)),
      targetDir_(std::move(targetDir)),
      deps_(std::move(deps)),
      control_(std::make_shared<ControlFlag>(ControlState::Stop)),
      progress_(std::make_shared<ProgressObject>()) {}

std::filesystem::path DownloadAgent::installDir() const {
  return std::filesystem::path(targetDir_) / id_;
}

RemoteEndpoint DownloadAgent::endpoint() const {
  RemoteEndpoint ep;
  ep.baseUrl = deps_->database->baseUrl();
  ep.authorization = deps_->authorization;
  if (ep.baseUrl.empty()) {
    throw DownloadError::communication(remote::RemoteAccessError(
        remote::RemoteReason::InvalidUrl, "no Drop instance configured"));
  }
  return ep;
}

DropManifest DownloadAgent::fetchManifest(const RemoteEndpoint& endpoint) {
  try {
    std::string url = remote::joinUrl(
        endpoint.baseUrl, "/api/v1/client/metadata/manifest?id=" +
                              remote::urlEncode(id_) +
                              "&version=" + remote::urlEncode(version_));
    std::vector<std::string> headers;
    if (endpoint.authorization) {
      headers.push_back("Authorization: " + endpoint.authorization());
    }
    remote::HttpTextResponse response =
        remote::fetchText(*deps_->http, url, headers);
    if (response.status != 200) {
      throw remote::RemoteAccessError(
          remote::RemoteReason::InvalidStatus,
          "manifest request returned HTTP " + std::to_string(response.status) +
              ": " + response.body,
          response.status);
    }
    return parseManifest(response.body);
  } catch (const remote::RemoteAccessError& e) {
    throw DownloadError::communication(e);
  }
}

void DownloadAgent::ensureContexts() {
  if (manifest_) return;

  DropManifest manifest = fetchManifest(endpoint());
  contexts_ = generateContexts(manifest, id_, version_, installDir());
  completed_.assign(contexts_.size(), false);
  progress_->setTotal(manifestTotalBytes(manifest));
  allocateFiles(manifest, installDir());
  LOG(INFO) << "[Agent] " << id_ << " has " << manifest.size() << " files in "
            << contexts_.size() << " chunks (" << progress_->total()
            << " bytes)";
  manifest_ = std::move(manifest);
}

bool DownloadAgent::download() {
  // 启动前已被暂停：不发请求直接返回
  if (control_->get() == ControlState::Stop) {
    LOG(INFO) << "[Agent] " << id_ << " is stopped, not starting";
    return false;
  }

  ensureContexts();

  // 被打断的分块会从头重下，进度回退到已完成分块为止
  uint64_t done = 0;
  for (size_t i = 0; i < contexts_.size(); ++i) {
    if (completed_[i]) done += contexts_[i].length;
  }
  progress_->set(done);

  const RemoteEndpoint ep = endpoint();
  for (size_t i = 0; i < contexts_.size(); ++i) {
    if (completed_[i]) continue;
    const DropDownloadContext& ctx = contexts_[i];
    if (!downloadGameChunk(ctx, control_, progress_, *deps_->http, ep,
                           deps_->options)) {
      LOG(INFO) << "[Agent] " << id_ << " stopped at " << ctx.fileName << "#"
                << ctx.index;
      return false;
    }
    completed_[i] = true;
  }

  LOG(INFO) << "[Agent] " << id_ << " finished downloading";
  return true;
}

bool DownloadAgent::start() {
  std::lock_guard<std::mutex> lock(runMutex_);
  control_->set(ControlState::Go);
  if (running_) return false;
  running_ = true;
  return true;
}

bool DownloadAgent::running() const {
  std::lock_guard<std::mutex> lock(runMutex_);
  return running_;
}

void DownloadAgent::markIdle() { finishRun(true); }

bool DownloadAgent::finishRun(bool force) {
  std::lock_guard<std::mutex> lock(runMutex_);
  if (!force && control_->get() == ControlState::Go) return false;
  running_ = false;
  return true;
}

void DownloadAgent::run(const SignalChannelHandle& channel) {
  LOG(INFO) << "[Agent] Worker started for " << id_;
  while (true) {
    bool completed = false;
    try {
      completed = download();
    } catch (const DownloadError& e) {
      LOG(ERROR) << "[Agent] Error while downloading " << id_ << ": " << e;
      finishRun(true);
      channel->push(Signal::failed(id_, e));
      return;
    } catch (const std::exception& e) {
      DownloadError wrapped = DownloadError::io(e.what());
      LOG(ERROR) << "[Agent] Error while downloading " << id_ << ": "
                 << wrapped;
      finishRun(true);
      channel->push(Signal::failed(id_, wrapped));
      return;
    }

    if (completed) {
      finishRun(true);
      channel->push(Signal::completed(id_));
      return;
    }
    if (finishRun(false)) {
      LOG(INFO) << "[Agent] Worker for " << id_ << " exited without completing";
      return;
    }
    // 退出前又收到了 Go
    LOG(INFO) << "[Agent] " << id_ << " resumed before the worker exited";
  }
}

}  // namespace downloads

#ifndef DOWNLOAD_AGENT_HPP_
#define DOWNLOAD_AGENT_HPP_

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ControlFlag.hpp"
#include "Database.hpp"
#include "DownloadContext.hpp"
#include "DownloadLogic.hpp"
#include "DownloadPipeline.hpp"
#include "HttpClient.hpp"
#include "Manifest.hpp"
#include "ProgressObject.hpp"
#include "Signal.hpp"

namespace downloads {

// 所有 agent 共享的外部依赖
struct AgentDependencies {
  std::shared_ptr<remote::HttpClient> http;
  std::shared_ptr<storage::Database> database;  // 读取服务器地址
  AuthorizationProvider authorization;
  PipelineOptions options;
};

/**
 * @brief 一个下载任务从入队到结束的全部状态
 *
 * 第一次运行时拉取清单并预分配文件，之后按顺序逐个下载分块。
 * 已完成的分块会被记住，暂停后再次运行时从未完成的分块继续。
 */
class DownloadAgent {
 public:
  DownloadAgent(std::string id, std::string version, std::string targetDir,
                std::shared_ptr<const AgentDependencies> deps);

  DownloadAgent(const DownloadAgent&) = delete;
  DownloadAgent& operator=(const DownloadAgent&) = delete;

  const std::string& id() const { return id_; }
  const std::string& version() const { return version_; }
  const std::string& targetDir() const { return targetDir_; }
  std::filesystem::path installDir() const;

  const ControlHandle& controlFlag() const { return control_; }
  const ProgressHandle& progress() const { return progress_; }

  // 下载全部分块。true：全部完成；false：被 Stop 打断。失败抛出 DownloadError
  bool download();

  // 调度线程调用：把标志置为 Go。没有工作线程在运行时标记为运行中并返回 true，
  // 调用方随后负责在新线程上执行 run()
  bool start();
  bool running() const;
  // 工作线程未能启动时由调度线程调用
  void markIdle();

  // 工作线程入口：执行 download() 并把结果通过 channel 回报
  void run(const SignalChannelHandle& channel);

 private:
  void ensureContexts();
  DropManifest fetchManifest(const RemoteEndpoint& endpoint);
  RemoteEndpoint endpoint() const;
  // 返回 false 表示停止期间又收到了 Go，需要继续运行
  bool finishRun(bool force);

  const std::string id_;
  const std::string version_;
  const std::string targetDir_;
  std::shared_ptr<const AgentDependencies> deps_;
  ControlHandle control_;
  ProgressHandle progress_;

  mutable std::mutex runMutex_;
  bool running_ = false;

  // 仅由当前工作线程访问（同一时刻最多一个）
  std::optional<DropManifest> manifest_;
  std::vector<DropDownloadContext> contexts_;
  std::vector<bool> completed_;
};

}  // namespace downloads

#endif  // DOWNLOAD_AGENT_HPP_

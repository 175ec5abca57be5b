#ifndef DOWNLOAD_SCHEDULER_HPP_
#define DOWNLOAD_SCHEDULER_HPP_

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "ControlFlag.hpp"
#include "Database.hpp"
#include "DownloadAgent.hpp"
#include "DownloadManager.hpp"
#include "GameEvents.hpp"
#include "JobQueue.hpp"
#include "ProgressObject.hpp"
#include "Signal.hpp"

namespace downloads {

/*
 * 下载调度器：在独立线程上逐条处理 Signal，一次只运行一个任务。
 *
 * 队列 queue_ 只保存任务 id 与状态，真正的 DownloadAgent 存放在 registry_ 中。
 * 两者必须在同一个信号处理函数里成对修改，否则会失去同步：
 * 不要绕过 Signal 直接增删队列。
 *
 * 任务完成、或取消活动任务后调度器会给自己再发一个 Go，从而依次清空队列；
 * 这个 Go 只在没有活动任务时发出，因此不会恢复被暂停或出错的任务。
 */
class DownloadScheduler {
 public:
  DownloadScheduler(SignalChannelHandle channel,
                    std::shared_ptr<const AgentDependencies> deps,
                    std::shared_ptr<EventEmitter> emitter);
  ~DownloadScheduler();

  DownloadScheduler(const DownloadScheduler&) = delete;
  DownloadScheduler& operator=(const DownloadScheduler&) = delete;

  // 创建调度器并在新线程上运行，返回调用方使用的句柄
  static std::unique_ptr<DownloadManager> build(
      std::shared_ptr<const AgentDependencies> deps,
      std::shared_ptr<EventEmitter> emitter);

  // 阻塞接收并处理信号，直到 Finish 或通道被 abort()
  void run();

  // 处理一条信号；返回 false 表示调度器已结束
  bool process(const Signal& signal);

  std::shared_ptr<const JobQueue> queue() const { return queue_; }
  std::shared_ptr<const ProgressSlot> progress() const { return progress_; }
  std::shared_ptr<const StatusCell> status() const { return status_; }
  std::vector<std::string> registryIds() const;
  std::optional<std::string> activeJobId() const;
  std::shared_ptr<DownloadAgent> agent(const std::string& id) const;

 private:
  struct Worker {
    std::string id;
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void manageGoSignal();
  void manageStopSignal();
  void manageQueueSignal(const std::string& id, const std::string& version,
                         const std::string& targetDir);
  void manageCompletedSignal(const std::string& id);
  void manageErrorSignal(const std::string& id,
                         const std::optional<DownloadError>& error);
  void manageCancelSignal(const std::string& id);
  void manageFinishSignal();

  void resumeActive();
  void launch(const std::shared_ptr<DownloadAgent>& agent);
  void clearActive();
  void reapWorkers(bool all);
  // 等待指定任务的工作线程退出
  void joinWorkers(const std::string& id);

  void setGameStatus(const std::string& id, storage::GameStatus status);
  void setStatus(ManagerState state,
                 std::optional<DownloadError> error = std::nullopt);

  SignalChannelHandle channel_;
  std::shared_ptr<const AgentDependencies> deps_;
  std::shared_ptr<EventEmitter> emitter_;

  std::unordered_map<std::string, std::shared_ptr<DownloadAgent>> registry_;
  std::shared_ptr<JobQueue> queue_;
  std::shared_ptr<ProgressSlot> progress_;
  std::shared_ptr<StatusCell> status_;

  // 队列中唯一处于 Go 状态的任务
  JobHandlePtr activeJob_;
  ControlHandle activeControlFlag_;

  std::vector<Worker> workers_;
  bool finished_ = false;
};

}  // namespace downloads

#endif  // DOWNLOAD_SCHEDULER_HPP_

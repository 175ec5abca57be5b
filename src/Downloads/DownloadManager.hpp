#ifndef DOWNLOAD_MANAGER_HPP_
#define DOWNLOAD_MANAGER_HPP_

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "DownloadError.hpp"
#include "JobQueue.hpp"
#include "ProgressObject.hpp"
#include "Signal.hpp"

namespace downloads {

enum class ManagerState { Empty, Downloading, Error, Paused };

const char* managerStateName(ManagerState state);

struct ManagerStatus {
  ManagerState state = ManagerState::Empty;
  std::optional<DownloadError> lastError;  // 仅 Error 时有值
};

// 调度线程写、观察者读的粗粒度状态
class StatusCell {
 public:
  ManagerStatus get() const;
  void set(ManagerStatus status);

 private:
  mutable std::mutex mutex_;
  ManagerStatus status_;
};

/**
 * @brief 调用方持有的下载管理器句柄
 *
 * 所有修改都以 Signal 的形式发往调度线程；队列、进度和状态只读。
 * 析构时若尚未 terminate() 会自动发送 Finish 并等待调度线程退出。
 */
class DownloadManager {
 public:
  DownloadManager(std::thread terminator, SignalChannelHandle sender,
                  std::shared_ptr<const JobQueue> queue,
                  std::shared_ptr<const ProgressSlot> progress,
                  std::shared_ptr<const StatusCell> status);
  ~DownloadManager();

  DownloadManager(const DownloadManager&) = delete;
  DownloadManager& operator=(const DownloadManager&) = delete;

  void queueGame(const std::string& id, const std::string& version,
                 const std::string& targetDir);
  void resumeDownloads();  // Go
  void pauseDownloads();   // Stop
  void cancelDownload(const std::string& id);
  void send(Signal signal);

  // 发送 Finish 并等待调度线程退出，之后不能再发送指令
  void terminate();

  ManagerStatus status() const;
  std::optional<ProgressSnapshot> progress() const;
  std::vector<JobSnapshot> queueSnapshot() const;
  std::shared_ptr<const JobQueue> queue() const { return queue_; }

 private:
  std::thread terminator_;
  SignalChannelHandle sender_;
  std::shared_ptr<const JobQueue> queue_;
  std::shared_ptr<const ProgressSlot> progress_;
  std::shared_ptr<const StatusCell> status_;
  std::once_flag terminateOnce_;
};

}  // namespace downloads

#endif  // DOWNLOAD_MANAGER_HPP_

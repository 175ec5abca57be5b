#include "DownloadManager.hpp"

#include "logger.hpp"

namespace downloads {

const char* managerStateName(ManagerState state) {
  switch (state) {
    case ManagerState::Empty:
      return "Empty";
    case ManagerState::Downloading:
      return "Downloading";
    case ManagerState::Error:
      return "Error";
    case ManagerState::Paused:
      return "Paused";
  }
  return "Unknown";
}

ManagerStatus StatusCell::get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

void StatusCell::set(ManagerStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  status_ = std::move(status);
}

DownloadManager::DownloadManager(std::thread terminator,
                                 SignalChannelHandle sender,
                                 std::shared_ptr<const JobQueue> queue,
                                 std::shared_ptr<const ProgressSlot> progress,
                                 std::shared_ptr<const StatusCell> status)
    : terminator_(std::move(terminator)),
      sender_(std::move(sender)),
      queue_(std::move(queue)),
      progress_(std::move(progress)),
      status_(std::move(status)) {}

DownloadManager::~DownloadManager() { terminate(); }

void DownloadManager::send(Signal signal) { sender_->push(std::move(signal)); }

void DownloadManager::queueGame(const std::string& id,
                                const std::string& version,
                                const std::string& targetDir) {
  send(Signal::queue(id, version, targetDir));
}

void DownloadManager::resumeDownloads() { send(Signal::go()); }

void DownloadManager::pauseDownloads() { send(Signal::stop()); }

void DownloadManager::cancelDownload(const std::string& id) {
  send(Signal::cancel(id));
}

void DownloadManager::terminate() {
  std::call_once(terminateOnce_, [this]() {
    send(Signal::finish());
    if (terminator_.joinable()) terminator_.join();
    LOG(INFO) << "[DownloadManager] Terminated";
  });
}

ManagerStatus DownloadManager::status() const { return status_->get(); }

std::optional<ProgressSnapshot> DownloadManager::progress() const {
  return progress_->snapshot();
}

std::vector<JobSnapshot> DownloadManager::queueSnapshot() const {
  return queue_->snapshot();
}

}  // namespace downloads

#include "DownloadScheduler.hpp"

#include <system_error>

#include "logger.hpp"

namespace downloads {

DownloadScheduler::DownloadScheduler(
    SignalChannelHandle channel, std::shared_ptr<const AgentDependencies> deps,
    std::shared_ptr<EventEmitter> emitter)
    : channel_(std::move(channel)),
      deps_(std::move(deps)),
      emitter_(std::move(emitter)),
      queue_(std::make_shared<JobQueue>()),
      progress_(std::make_shared<ProgressSlot>()),
      status_(std::make_shared<StatusCell>()) {}

DownloadScheduler::~DownloadScheduler() {
  if (activeControlFlag_) activeControlFlag_->set(ControlState::Stop);
  reapWorkers(true);
}

std::unique_ptr<DownloadManager> DownloadScheduler::build(
    std::shared_ptr<const AgentDependencies> deps,
    std::shared_ptr<EventEmitter> emitter) {
  auto channel = std::make_shared<SignalChannel>();
  auto scheduler = std::make_unique<DownloadScheduler>(channel, std::move(deps),
                                                       std::move(emitter));
  auto queue = scheduler->queue();
  auto progress = scheduler->progress();
  auto status = scheduler->status();

  std::thread terminator(
      [scheduler = std::move(scheduler)]() { scheduler->run(); });

  return std::make_unique<DownloadManager>(std::move(terminator), channel,
                                           queue, progress, status);
}

void DownloadScheduler::run() {
  LOG(INFO) << "[Scheduler] Started";
  while (true) {
    Signal signal;
    try {
      channel_->pop(signal);
    } catch (const tbb::user_abort&) {
      // 通道被关闭，无法再收到任何指令
      LOG(ERROR) << "[Scheduler] Command channel closed, shutting down";
      manageFinishSignal();
      return;
    }
    if (!process(signal)) break;
  }
  LOG(INFO) << "[Scheduler] Stopped";
}

bool DownloadScheduler::process(const Signal& signal) {
  if (finished_) {
    LOG(WARN) << "[Scheduler] Ignoring signal '" << signalName(signal.type)
              << "' after Finish";
    return false;
  }
  LOG(INFO) << "[Scheduler] Got signal '" << signalName(signal.type) << "'"
            << (signal.id.empty() ? "" : " for ") << signal.id;

  switch (signal.type) {
    case Signal::Type::Go:
      manageGoSignal();
      break;
    case Signal::Type::Stop:
      manageStopSignal();
      break;
    case Signal::Type::Queue:
      manageQueueSignal(signal.id, signal.version, signal.targetDir);
      break;
    case Signal::Type::Completed:
      manageCompletedSignal(signal.id);
      break;
    case Signal::Type::Error:
      manageErrorSignal(signal.id, signal.error);
      break;
    case Signal::Type::Cancel:
      manageCancelSignal(signal.id);
      break;
    case Signal::Type::Finish:
      manageFinishSignal();
      return false;
  }
  return true;
}

void DownloadScheduler::manageGoSignal() {
  reapWorkers(false);

  if (activeJob_) {
    resumeActive();
    return;
  }
  if (registry_.empty() || queue_->isEmpty()) {
    LOG(DEBUG) << "[Scheduler] Nothing to download";
    setStatus(ManagerState::Empty);
    return;
  }

  JobHandlePtr job = queue_->front();
  auto it = registry_.find(job->id);
  if (it == registry_.end()) {
    LOG(ERROR) << "[Scheduler] No download agent registered for " << job->id;
    return;
  }
  std::shared_ptr<DownloadAgent> agent = it->second;

  LOG(INFO) << "[Scheduler] Starting download agent for " << job->id;
  activeJob_ = job;
  activeControlFlag_ = agent->controlFlag();
  progress_->bind(agent->progress());

  launch(agent);

  job->status = JobStatus::Downloading;
  setStatus(ManagerState::Downloading);
  setGameStatus(job->id, storage::GameStatus::Downloading);
}

// 当前任务已暂停或失败时重新启动；仍在运行时只重新置为 Go
void DownloadScheduler::resumeActive() {
  auto it = registry_.find(activeJob_->id);
  if (it == registry_.end()) {
    LOG(ERROR) << "[Scheduler] Active job " << activeJob_->id
               << " has no download agent";
    return;
  }

  if (it->second->running()) {
    LOG(DEBUG) << "[Scheduler] " << activeJob_->id << " is already running";
  } else {
    LOG(INFO) << "[Scheduler] Resuming " << activeJob_->id;
  }
  launch(it->second);

  if (activeJob_->status.load() != JobStatus::Downloading) {
    activeJob_->status = JobStatus::Downloading;
    setGameStatus(activeJob_->id, storage::GameStatus::Downloading);
  }
  setStatus(ManagerState::Downloading);
}

void DownloadScheduler::launch(const std::shared_ptr<DownloadAgent>& agent) {
  // start() 先把标志置为 Go，再由新线程开始下载
  if (!agent->start()) return;

  auto done = std::make_shared<std::atomic<bool>>(false);
  SignalChannelHandle channel = channel_;
  try {
    std::thread worker([agent, channel, done]() {
      agent->run(channel);
      done->store(true);
    });
    workers_.push_back(Worker{agent->id(), std::move(worker), done});
  } catch (const std::system_error& e) {
    LOG(ERROR) << "[Scheduler] Unable to spawn worker for " << agent->id()
               << ": " << e.what();
    agent->markIdle();
    channel_->push(Signal::failed(
        agent->id(),
        DownloadError::io(std::string("unable to spawn worker: ") + e.what())));
  }
}

void DownloadScheduler::manageStopSignal() {
  if (!activeControlFlag_) return;
  activeControlFlag_->set(ControlState::Stop);
  if (status_->get().state == ManagerState::Downloading) {
    setStatus(ManagerState::Paused);
  }
}

void DownloadScheduler::manageQueueSignal(const std::string& id,
                                          const std::string& version,
                                          const std::string& targetDir) {
  if (id.empty()) {
    LOG(WARN) << "[Scheduler] Ignoring Queue signal without a game id";
    return;
  }
  if (registry_.count(id) > 0 || queue_->contains(id)) {
    LOG(WARN) << "[Scheduler] " << id << " is already queued";
    return;
  }

  auto agent =
      std::make_shared<DownloadAgent>(id, version, targetDir, deps_);
  auto handle = std::make_shared<JobHandle>(id);

  registry_.emplace(id, std::move(agent));
  queue_->append(handle);

  handle->status = JobStatus::Queued;
  setGameStatus(id, storage::GameStatus::Queued);
}

void DownloadScheduler::manageCompletedSignal(const std::string& id) {
  if (!activeJob_ || activeJob_->id != id) {
    LOG(DEBUG) << "[Scheduler] Ignoring stale completion for " << id;
    return;
  }

  LOG(INFO) << "[Scheduler] Popping consumed data for " << id;
  JobHandlePtr front = queue_->front();
  if (front && front->id == id) {
    queue_->popFront();
  } else {
    LOG(WARN) << "[Scheduler] Completed job " << id
              << " was not at the front of the queue";
    queue_->remove(id);
  }
  registry_.erase(id);

  activeJob_->status = JobStatus::Completed;
  clearActive();
  setGameStatus(id, storage::GameStatus::Installed);

  channel_->push(Signal::go());
}

void DownloadScheduler::manageErrorSignal(
    const std::string& id, const std::optional<DownloadError>& error) {
  if (!activeJob_ || (!id.empty() && activeJob_->id != id)) {
    LOG(WARN) << "[Scheduler] Ignoring error from inactive job " << id;
    return;
  }

  DownloadError reported =
      error ? *error : DownloadError::io("unknown download error");
  LOG(ERROR) << "[Scheduler] " << activeJob_->id << " failed: " << reported;

  activeJob_->status = JobStatus::Error;
  setStatus(ManagerState::Error, reported);
  setGameStatus(activeJob_->id, storage::GameStatus::Error);
}

void DownloadScheduler::manageCancelSignal(const std::string& id) {
  bool wasActive = activeJob_ && activeJob_->id == id;
  if (wasActive) {
    activeControlFlag_->set(ControlState::Stop);
    clearActive();
    // 旧的工作线程退出之前不能启动下一个任务，否则两个线程同时写文件
    joinWorkers(id);
  }

  bool inRegistry = registry_.erase(id) > 0;
  bool inQueue = queue_->remove(id);
  if (!inRegistry && !inQueue) {
    LOG(DEBUG) << "[Scheduler] Cancel for unknown job " << id;
    return;
  }
  if (inRegistry != inQueue) {
    LOG(ERROR) << "[Scheduler] Queue and registry disagreed about " << id;
  }

  setGameStatus(id, storage::GameStatus::Remote);

  // 另一个任务仍是活动任务（运行、暂停或出错）时不发 Go，
  // 否则会把暂停或出错的任务重新启动
  if (activeJob_) return;
  channel_->push(Signal::go());
}

void DownloadScheduler::manageFinishSignal() {
  if (activeControlFlag_) activeControlFlag_->set(ControlState::Stop);
  reapWorkers(true);
  finished_ = true;
}

void DownloadScheduler::clearActive() {
  activeJob_.reset();
  activeControlFlag_.reset();
  progress_->clear();
}

void DownloadScheduler::reapWorkers(bool all) {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (all || it->done->load()) {
      if (it->thread.joinable()) it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

void DownloadScheduler::joinWorkers(const std::string& id) {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->id == id) {
      LOG(DEBUG) << "[Scheduler] Waiting for the worker of " << id;
      if (it->thread.joinable()) it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

void DownloadScheduler::setGameStatus(const std::string& id,
                                      storage::GameStatus status) {
  // 持久化或通知失败不影响内存中的状态转换
  try {
    deps_->database->setGameStatus(id, status);
  } catch (const std::exception& e) {
    LOG(ERROR) << "[Scheduler] Unable to persist status "
               << storage::gameStatusName(status) << " for " << id << ": "
               << e.what();
  }
  if (!emitter_) return;
  try {
    emitter_->emitGameUpdate(GameUpdateEvent{id, status});
  } catch (const std::exception& e) {
    LOG(ERROR) << "[Scheduler] Unable to emit update for " << id << ": "
               << e.what();
  }
}

void DownloadScheduler::setStatus(ManagerState state,
                                  std::optional<DownloadError> error) {
  ManagerStatus status;
  status.state = state;
  status.lastError = std::move(error);
  status_->set(std::move(status));
}

std::vector<std::string> DownloadScheduler::registryIds() const {
  std::vector<std::string> ids;
  ids.reserve(registry_.size());
  for (const auto& kv : registry_) ids.push_back(kv.first);
  return ids;
}

std::optional<std::string> DownloadScheduler::activeJobId() const {
  if (!activeJob_) return std::nullopt;
  return activeJob_->id;
}

std::shared_ptr<DownloadAgent> DownloadScheduler::agent(
    const std::string& id) const {
  auto it = registry_.find(id);
  if (it == registry_.end()) return nullptr;
  return it->second;
}

}  // namespace downloads

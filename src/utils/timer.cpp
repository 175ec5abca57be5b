#include "timer.hpp"

#include "logger.hpp"

namespace utils {

Timer::Timer() : nextId_(1), running_(false) {}
Timer::~Timer() { stop(); }

Timer::TaskId Timer::addOnceTask(std::chrono::milliseconds delay,
                                 std::function<void()> callback) {
  auto execution_time = std::chrono::steady_clock::now() + delay;
  return schedule(TimerTask(0, execution_time, std::move(callback)));
}

Timer::TaskId Timer::addPeriodicTask(std::chrono::milliseconds delay,
                                     std::chrono::milliseconds period,
                                     std::function<void()> callback) {
  auto execution_time = std::chrono::steady_clock::now() + delay;
  return schedule(
      TimerTask(0, execution_time, std::move(callback), true, period));
}

Timer::TaskId Timer::schedule(TimerTask task) {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  task.id = nextId_++;
  TaskId id = task.id;
  taskQueue_.push(std::move(task));
  tasksCv_.notify_one();
  return id;
}

void Timer::cancel(TaskId id) {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  cancelled_.insert(id);
  tasksCv_.notify_one();
}

void Timer::start() {
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    if (running_) return;  // Already running
    running_ = true;
  }
  timerThread_ = std::thread(&Timer::loop, this);
}

bool Timer::running() const {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  return running_;
}

void Timer::loop() {
  std::unique_lock<std::mutex> lock(tasksMutex_);
  while (running_) {
    if (taskQueue_.empty()) {
      tasksCv_.wait(lock,
                    [this]() { return !taskQueue_.empty() || !running_; });
      continue;
    }

    auto nextTask = taskQueue_.top();
    if (cancelled_.count(nextTask.id)) {
      taskQueue_.pop();
      cancelled_.erase(nextTask.id);
      continue;
    }

    auto now = std::chrono::steady_clock::now();
    if (nextTask.execTimestamp > now) {
      tasksCv_.wait_until(lock, nextTask.execTimestamp, [this, &nextTask]() {
        return !running_ || cancelled_.count(nextTask.id) > 0 ||
               (!taskQueue_.empty() &&
                taskQueue_.top().execTimestamp < nextTask.execTimestamp);
      });
      continue;
    }

    taskQueue_.pop();
    if (nextTask.isPeriodic) {
      TimerTask again = nextTask;
      again.execTimestamp += again.period;
      taskQueue_.push(std::move(again));
    }

    lock.unlock();  // Unlock before executing the callback
    try {
      nextTask.callback();
    } catch (const std::exception& e) {
      LOG(ERROR) << "[Timer] Task " << nextTask.id << " threw: " << e.what();
    }
    lock.lock();
  }
}

void Timer::stop() {
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    running_ = false;
    tasksCv_.notify_all();  // Notify the thread to wake up and exit
  }

  if (timerThread_.joinable()) {
    timerThread_.join();
  }
}

}  // namespace utils

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_set>
#include <vector>

namespace utils {

// 单线程定时器：一次性任务与周期任务都在后台线程上执行，回调执行时不持锁。
class Timer {
 public:
  using TaskId = uint64_t;

  struct TimerTask {
    TaskId id;
    std::chrono::steady_clock::time_point execTimestamp;
    std::function<void()> callback;
    bool isPeriodic;
    std::chrono::milliseconds period;

    TimerTask(
        TaskId taskId, std::chrono::steady_clock::time_point execTime,
        std::function<void()> cb, bool periodic = false,
        std::chrono::milliseconds periodDuration = std::chrono::milliseconds(0))
        : id(taskId),
          execTimestamp(execTime),
          callback(std::move(cb)),
          isPeriodic(periodic),
          period(periodDuration) {}
    bool operator>(const TimerTask& other) const {
      return execTimestamp > other.execTimestamp;
    }
  };

  Timer();
  ~Timer();

  Timer(const Timer&) = delete;
  Timer& operator=(const Timer&) = delete;

  TaskId addOnceTask(std::chrono::milliseconds delay,
                     std::function<void()> callback);
  TaskId addPeriodicTask(std::chrono::milliseconds delay,
                         std::chrono::milliseconds period,
                         std::function<void()> callback);
  // 取消尚未执行（或周期中）的任务；正在执行的回调不会被打断
  void cancel(TaskId id);

  void start();
  void stop();
  bool running() const;

 private:
  TaskId schedule(TimerTask task);
  void loop();

  std::priority_queue<TimerTask, std::vector<TimerTask>,
                      std::greater<TimerTask>>
      taskQueue_;
  std::unordered_set<TaskId> cancelled_;
  mutable std::mutex tasksMutex_;
  std::condition_variable tasksCv_;
  std::thread timerThread_;
  TaskId nextId_;
  bool running_;
};

}  // namespace utils

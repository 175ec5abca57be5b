#ifndef JOB_QUEUE_HPP_
#define JOB_QUEUE_HPP_

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace downloads {

enum class JobStatus { Uninitialised, Queued, Downloading, Error, Completed };

const char* jobStatusName(JobStatus status);

// 队列中的轻量任务句柄；只有调度线程会修改 status
struct JobHandle {
  explicit JobHandle(std::string jobId,
                     JobStatus initial = JobStatus::Uninitialised)
      : id(std::move(jobId)), status(initial) {}

  const std::string id;
  std::atomic<JobStatus> status;
};

using JobHandlePtr = std::shared_ptr<JobHandle>;

struct JobSnapshot {
  std::string id;
  JobStatus status;
};

/**
 * @brief 有序的下载队列
 *
 * 只能由调度线程修改，并且每次修改都要与 agent 注册表的增删成对出现，
 * 否则两者会失去同步。其他线程只通过 const 接口读取。
 */
class JobQueue {
 public:
  void append(JobHandlePtr job);
  // 空队列时无操作
  void popFront();
  // 按 id 移除任意位置的任务
  bool remove(const std::string& id);

  // 空队列返回 nullptr
  JobHandlePtr front() const;
  bool isEmpty() const;
  size_t size() const;
  bool contains(const std::string& id) const;
  std::vector<std::string> ids() const;
  std::vector<JobSnapshot> snapshot() const;

  // 持锁访问整个列表
  template <typename F>
  auto read(F&& fn) const
      -> decltype(fn(std::declval<const std::deque<JobHandlePtr>&>())) {
    std::lock_guard<std::mutex> lock(mutex_);
    return fn(static_cast<const std::deque<JobHandlePtr>&>(jobs_));
  }

  template <typename F>
  auto edit(F&& fn)
      -> decltype(fn(std::declval<std::deque<JobHandlePtr>&>())) {
    std::lock_guard<std::mutex> lock(mutex_);
    return fn(jobs_);
  }

 private:
  mutable std::mutex mutex_;
  std::deque<JobHandlePtr> jobs_;
};

}  // namespace downloads

#endif  // JOB_QUEUE_HPP_

#ifndef PROGRESS_OBJECT_HPP_
#define PROGRESS_OBJECT_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace downloads {

struct ProgressSnapshot {
  uint64_t current = 0;
  uint64_t total = 0;

  // total 为 0 时返回 0
  double fraction() const;
};

/**
 * @brief 单个任务的字节进度
 *
 * 同一时刻只有一个写者（当前的分块流水线），读者任意。
 * 下载过程中只增不减；唯一的例外是恢复下载时 set() 回退到
 * 已完成分块的字节数，被打断的分块会从头重下。
 */
class ProgressObject {
 public:
  explicit ProgressObject(uint64_t total = 0);

  void add(uint64_t delta);
  // 恢复下载时回退到已完成分块的字节数
  void set(uint64_t current);
  void setTotal(uint64_t total);

  uint64_t current() const;
  uint64_t total() const;
  ProgressSnapshot snapshot() const;

 private:
  std::atomic<uint64_t> current_;
  std::atomic<uint64_t> total_;
};

using ProgressHandle = std::shared_ptr<ProgressObject>;

// 对外可见的"当前进度"槽位；没有活动任务时为空
class ProgressSlot {
 public:
  void bind(ProgressHandle progress);
  void clear();
  bool bound() const;
  std::optional<ProgressSnapshot> snapshot() const;

 private:
  mutable std::mutex mutex_;
  ProgressHandle progress_;
};

}  // namespace downloads

#endif  // PROGRESS_OBJECT_HPP_

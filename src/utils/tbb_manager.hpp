#ifndef TBB_MANAGER_HPP_
#define TBB_MANAGER_HPP_

#include <tbb/tbb.h>

#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "flags.hpp"
#include "logger.hpp"

namespace utils {

struct TBBState {
  bool initialized = false;
  int concurrency = 0;
  std::shared_ptr<tbb::task_arena> arena;
};

/**
 * @brief TBB任务管理器，按名称管理 arena
 *
 * 每个 arena 的并发度来自 --custom_tbb_parallel_control（如 "allocate:4"），
 * 未配置时使用 tbb::info::default_concurrency()。
 */
class TBBManager {
 public:
  static TBBManager& GetInstance();

  std::shared_ptr<tbb::task_arena> Init(const std::string& tbb_name);

  // 在指定 arena 中并行执行 task(i)，i ∈ [start, end)。
  // 所有任务结束后重新抛出第一个异常。
  template <typename IntType, typename Func>
  void ParallelFor(const std::string& tbb_name, IntType start, IntType end,
                   const Func& task);

  int Concurrency(const std::string& tbb_name);

  void Release();
  ~TBBManager();

  static std::map<std::string, int> ParseParallelCountDefines(
      const std::string& cfg);
  static std::map<std::string, int>& GetTBBParallelCountDefines();

 private:
  TBBManager() = default;
  TBBManager(const TBBManager&) = delete;
  TBBManager& operator=(const TBBManager&) = delete;

  uint64_t GenerateUniqueTaskId() const;

  std::unordered_map<std::string, TBBState> task_arenas_;
  mutable std::mutex arenas_mutex_;
};

// 模板实现
template <typename IntType, typename Func>
void TBBManager::ParallelFor(const std::string& tbb_name, IntType start,
                             IntType end, const Func& task) {
  if (start >= end) return;
  std::string unique_task_name =
      tbb_name + "_" + std::to_string(GenerateUniqueTaskId());

  auto arena = Init(tbb_name);

  std::mutex error_mutex;
  std::exception_ptr first_error;

  LOG(DEBUG) << "[TBBManager] ParallelFor start: " << unique_task_name << " ["
             << start << "," << end << ")";
  arena->execute([&]() {
    tbb::parallel_for(
        tbb::blocked_range<IntType>(start, end),
        [&](const tbb::blocked_range<IntType>& range) {
          for (IntType i = range.begin(); i < range.end(); ++i) {
            try {
              task(i);
            } catch (const std::exception& e) {
              LOG(ERROR) << "[TBBManager] Exception in task "
                         << unique_task_name << "#" << i << ": " << e.what();
              std::lock_guard<std::mutex> lock(error_mutex);
              if (!first_error) first_error = std::current_exception();
            }
          }
        });
  });
  LOG(DEBUG) << "[TBBManager] ParallelFor end: " << unique_task_name;

  if (first_error) std::rethrow_exception(first_error);
}

}  // namespace utils

#endif  // TBB_MANAGER_HPP_

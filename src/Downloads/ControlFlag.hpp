#ifndef CONTROL_FLAG_HPP_
#define CONTROL_FLAG_HPP_

#include <atomic>
#include <memory>

namespace downloads {

enum class ControlState { Go, Pause, Stop };

inline const char* controlStateName(ControlState state) {
  switch (state) {
    case ControlState::Go:
      return "Go";
    case ControlState::Pause:
      return "Pause";
    case ControlState::Stop:
      return "Stop";
  }
  return "Unknown";
}

// 下载线程的协作式控制标志：后写者生效，工作线程在拷贝循环中轮询。
class ControlFlag {
 public:
  explicit ControlFlag(ControlState initial = ControlState::Go)
      : state_(initial) {}

  void set(ControlState state) { state_.store(state, std::memory_order_release); }
  ControlState get() const { return state_.load(std::memory_order_acquire); }

 private:
  std::atomic<ControlState> state_;
};

using ControlHandle = std::shared_ptr<ControlFlag>;

}  // namespace downloads

#endif  // CONTROL_FLAG_HPP_

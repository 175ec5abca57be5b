#ifndef DOWNLOAD_SIGNAL_HPP_
#define DOWNLOAD_SIGNAL_HPP_

#include <tbb/concurrent_queue.h>

#include <memory>
#include <optional>
#include <string>

#include "DownloadError.hpp"

namespace downloads {

/**
 * @brief 发给调度线程的指令
 *
 * Go：尝试开始队首任务；Stop：暂停当前任务；Queue：加入新任务；
 * Completed / Error：工作线程回报结果；Cancel：移除任务；Finish：结束调度线程。
 */
struct Signal {
  enum class Type { Go, Stop, Queue, Completed, Error, Cancel, Finish };

  Type type = Type::Go;
  std::string id;
  std::string version;
  std::string targetDir;
  std::optional<DownloadError> error;

  static Signal go() { return Signal(); }
  static Signal stop() { return make(Type::Stop); }
  static Signal queue(std::string id, std::string version,
                      std::string targetDir) {
    Signal s = make(Type::Queue, std::move(id));
    s.version = std::move(version);
    s.targetDir = std::move(targetDir);
    return s;
  }
  static Signal completed(std::string id) {
    return make(Type::Completed, std::move(id));
  }
  static Signal failed(std::string id, const DownloadError& error) {
    Signal s = make(Type::Error, std::move(id));
    s.error = error;
    return s;
  }
  static Signal cancel(std::string id) {
    return make(Type::Cancel, std::move(id));
  }
  static Signal finish() { return make(Type::Finish); }

 private:
  static Signal make(Type type, std::string id = std::string()) {
    Signal s;
    s.type = type;
    s.id = std::move(id);
    return s;
  }
};

inline const char* signalName(Signal::Type type) {
  switch (type) {
    case Signal::Type::Go:
      return "Go";
    case Signal::Type::Stop:
      return "Stop";
    case Signal::Type::Queue:
      return "Queue";
    case Signal::Type::Completed:
      return "Completed";
    case Signal::Type::Error:
      return "Error";
    case Signal::Type::Cancel:
      return "Cancel";
    case Signal::Type::Finish:
      return "Finish";
  }
  return "Unknown";
}

// 多生产者、单消费者（调度线程）的指令通道。abort() 视为通道意外关闭。
using SignalChannel = tbb::concurrent_bounded_queue<Signal>;
using SignalChannelHandle = std::shared_ptr<SignalChannel>;

}  // namespace downloads

#endif  // DOWNLOAD_SIGNAL_HPP_

#ifndef GAME_EVENTS_HPP_
#define GAME_EVENTS_HPP_

#include <string>

#include "Database.hpp"

namespace downloads {

struct GameUpdateEvent {
  std::string gameId;
  storage::GameStatus status;

  // 前端订阅的事件名
  std::string eventName() const { return "update_game/" + gameId; }
};

// 界面层的通知接口；在调度线程上同步调用，失败时抛出异常
class EventEmitter {
 public:
  virtual ~EventEmitter() = default;
  virtual void emitGameUpdate(const GameUpdateEvent& event) = 0;
};

// 只写日志的实现，命令行模式下使用
class LoggingEventEmitter : public EventEmitter {
 public:
  void emitGameUpdate(const GameUpdateEvent& event) override;
};

}  // namespace downloads

#endif  // GAME_EVENTS_HPP_

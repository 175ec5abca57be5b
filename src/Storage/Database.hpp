#ifndef DATABASE_HPP_
#define DATABASE_HPP_

#include <optional>
#include <stdexcept>
#include <string>

namespace storage {

// 持久化的单个游戏状态
enum class GameStatus { Remote, Queued, Downloading, Installed, Error };

const char* gameStatusName(GameStatus status);
std::optional<GameStatus> parseGameStatus(const std::string& name);

class DatabaseError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief 下载核心读取服务器地址、写入游戏状态的存储接口
 *
 * 实现需要线程安全：状态写入来自调度线程，读取可能来自任意线程。
 * 写入失败抛出 DatabaseError。
 */
class Database {
 public:
  virtual ~Database() = default;

  virtual std::string baseUrl() const = 0;
  virtual void setBaseUrl(const std::string& url) = 0;

  virtual std::optional<GameStatus> gameStatus(const std::string& id) const = 0;
  virtual void setGameStatus(const std::string& id, GameStatus status) = 0;
};

}  // namespace storage

#endif  // DATABASE_HPP_

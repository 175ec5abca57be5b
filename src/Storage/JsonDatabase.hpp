#ifndef JSON_DATABASE_HPP_
#define JSON_DATABASE_HPP_

#include <map>
#include <mutex>
#include <string>

#include "Database.hpp"

namespace storage {

// 以 JSON 文件保存的 Database，每次写入立即落盘：
// {"base_url": "...", "games": {"statuses": {"<id>": "Installed"}}}
class JsonDatabase : public Database {
 public:
  // 文件不存在时从空库开始；文件损坏时抛出 DatabaseError
  explicit JsonDatabase(std::string path);

  std::string baseUrl() const override;
  void setBaseUrl(const std::string& url) override;

  std::optional<GameStatus> gameStatus(const std::string& id) const override;
  void setGameStatus(const std::string& id, GameStatus status) override;

  const std::string& path() const { return path_; }

 private:
  void load();
  void saveLocked() const;

  std::string path_;
  mutable std::mutex mutex_;
  std::string baseUrl_;
  std::map<std::string, GameStatus> statuses_;
};

}  // namespace storage

#endif  // JSON_DATABASE_HPP_

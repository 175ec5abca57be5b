#include "JsonDatabase.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

#include "logger.hpp"

namespace storage {

using nlohmann::json;

JsonDatabase::JsonDatabase(std::string path) : path_(std::move(path)) {
  load();
}

void JsonDatabase::load() {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    LOG(INFO) << "[Database] No database at " << path_ << ", starting empty";
    return;
  }

  std::ifstream ifs(path_);
  if (!ifs) throw DatabaseError("cannot open database file: " + path_);

  json root;
  try {
    ifs >> root;
  } catch (const json::exception& e) {
    throw DatabaseError("invalid database json in " + path_ + ": " +
                        e.what());
  }

  baseUrl_ = root.value("base_url", std::string());
  if (root.contains("games") && root["games"].contains("statuses")) {
    for (const auto& item : root["games"]["statuses"].items()) {
      if (!item.value().is_string()) continue;
      auto status = parseGameStatus(item.value().get<std::string>());
      if (!status) {
        LOG(WARN) << "[Database] Unknown status for game " << item.key()
                  << ", ignoring";
        continue;
      }
      statuses_[item.key()] = *status;
    }
  }
  LOG(INFO) << "[Database] Loaded " << statuses_.size()
            << " game statuses from " << path_;
}

void JsonDatabase::saveLocked() const {
  json root;
  root["base_url"] = baseUrl_;
  json statuses = json::object();
  for (const auto& kv : statuses_) {
    statuses[kv.first] = gameStatusName(kv.second);
  }
  root["games"]["statuses"] = statuses;

  // 先写临时文件再改名，避免写到一半留下损坏的库
  std::filesystem::path target(path_);
  std::filesystem::path tmp = target;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::trunc);
    if (!ofs) throw DatabaseError("cannot write database file: " + tmp.string());
    ofs << root.dump(2);
    ofs.flush();
    if (!ofs) throw DatabaseError("write failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    throw DatabaseError("cannot replace " + path_ + ": " + ec.message());
  }
}

std::string JsonDatabase::baseUrl() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return baseUrl_;
}

void JsonDatabase::setBaseUrl(const std::string& url) {
  std::lock_guard<std::mutex> lock(mutex_);
  baseUrl_ = url;
  saveLocked();
}

std::optional<GameStatus> JsonDatabase::gameStatus(
    const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = statuses_.find(id);
  if (it == statuses_.end()) return std::nullopt;
  return it->second;
}

void JsonDatabase::setGameStatus(const std::string& id, GameStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  statuses_[id] = status;
  saveLocked();
}

}  // namespace storage

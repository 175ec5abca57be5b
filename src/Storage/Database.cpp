#include "Database.hpp"

namespace storage {

const char* gameStatusName(GameStatus status) {
  switch (status) {
    case GameStatus::Remote:
      return "Remote";
    case GameStatus::Queued:
      return "Queued";
    case GameStatus::Downloading:
      return "Downloading";
    case GameStatus::Installed:
      return "Installed";
    case GameStatus::Error:
      return "Error";
  }
  return "Unknown";
}

std::optional<GameStatus> parseGameStatus(const std::string& name) {
  if (name == "Remote") return GameStatus::Remote;
  if (name == "Queued") return GameStatus::Queued;
  if (name == "Downloading") return GameStatus::Downloading;
  if (name == "Installed") return GameStatus::Installed;
  if (name == "Error") return GameStatus::Error;
  return std::nullopt;
}

}  // namespace storage

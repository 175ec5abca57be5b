#include <gflags/gflags.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "DownloadScheduler.hpp"
#include "GameEvents.hpp"
#include "HttpClient.hpp"
#include "JsonDatabase.hpp"
#include "Remote.hpp"
#include "flags.hpp"
#include "logger.hpp"
#include "tbb_manager.hpp"
#include "timer.hpp"

DEFINE_string(database, "drop_data.json", "Path of the JSON state database");
DEFINE_string(base_url, "",
              "Drop instance to use; stored in the database once verified");
DEFINE_string(game_id, "", "Game to download");
DEFINE_string(version, "", "Version of the game to download");
DEFINE_string(install_dir, "games",
              "Directory games are installed into (<install_dir>/<game_id>)");
DEFINE_string(authorization, "", "Value of the Authorization header");
DEFINE_int32(progress_interval_ms, 1000,
             "Interval between progress reports, 0 to disable");

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage(
      "drop_downloader --game_id=<id> --version=<version> "
      "[--base_url=<url>] [--install_dir=<dir>]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  utils::LogConfig logCfg;
  logCfg.logFilePath = FLAGS_log_dir;
  logCfg.maxFileSize = 10 * 1024 * 1024;
  logCfg.maxBackupFiles = 3;
  logCfg.minLevel = utils::Logger::parseLevel(FLAGS_log_level);
  utils::Logger::initialize(logCfg);

  if (FLAGS_game_id.empty() || FLAGS_version.empty()) {
    gflags::ShowUsageWithFlagsRestrict(argv[0], "main");
    return 1;
  }

  std::shared_ptr<storage::JsonDatabase> database;
  try {
    database = std::make_shared<storage::JsonDatabase>(FLAGS_database);
  } catch (const storage::DatabaseError& e) {
    LOG(ERROR) << "[Main] " << e.what();
    return 1;
  }

  remote::CurlOptions curlOptions;
  curlOptions.userAgent = FLAGS_http_user_agent;
  if (FLAGS_copy_buffer_size > 0) {
    curlOptions.receiveBufferSize = static_cast<size_t>(FLAGS_copy_buffer_size);
  }
  auto http = std::make_shared<remote::CurlHttpClient>(curlOptions);

  if (!FLAGS_base_url.empty()) {
    try {
      remote::useRemote(*database, *http, FLAGS_base_url);
    } catch (const std::exception& e) {
      LOG(ERROR) << "[Main] " << e.what();
      return 1;
    }
  }
  if (database->baseUrl().empty()) {
    LOG(ERROR) << "[Main] No Drop instance configured, pass --base_url";
    return 1;
  }

  auto deps = std::make_shared<downloads::AgentDependencies>();
  deps->http = http;
  deps->database = database;
  if (!FLAGS_authorization.empty()) {
    std::string authorization = FLAGS_authorization;
    deps->authorization = [authorization]() { return authorization; };
  }
  deps->options = downloads::PipelineOptions::fromFlags();

  auto manager = downloads::DownloadScheduler::build(
      deps, std::make_shared<downloads::LoggingEventEmitter>());

  manager->queueGame(FLAGS_game_id, FLAGS_version, FLAGS_install_dir);
  manager->resumeDownloads();

  utils::Timer timer;
  if (FLAGS_progress_interval_ms > 0) {
    auto interval = std::chrono::milliseconds(FLAGS_progress_interval_ms);
    downloads::DownloadManager* observed = manager.get();
    timer.addPeriodicTask(interval, interval, [observed]() {
      auto progress = observed->progress();
      if (!progress) return;
      LOG(INFO) << "[Main] " << progress->current << "/" << progress->total
                << " bytes (" << static_cast<int>(progress->fraction() * 100)
                << "%)";
    });
    timer.start();
  }

  // 队列清空即完成；Error 状态下任务会停在队首，直接退出
  int exitCode = 0;
  while (true) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    downloads::ManagerStatus status = manager->status();
    if (status.state == downloads::ManagerState::Error) {
      if (status.lastError) {
        LOG(ERROR) << "[Main] Download failed: " << *status.lastError;
      }
      exitCode = 2;
      break;
    }
    if (manager->queue()->isEmpty()) break;
  }

  timer.stop();
  manager->terminate();
  utils::TBBManager::GetInstance().Release();

  if (exitCode == 0) {
    LOG(INFO) << "[Main] " << FLAGS_game_id << " installed";
  }
  return exitCode;
}

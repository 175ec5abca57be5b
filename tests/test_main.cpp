#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <filesystem>

#include "logger.hpp"

int main(int argc, char* argv[]) {
  // 测试期间日志只写文件
  utils::LogConfig logCfg;
  logCfg.logFilePath =
      (std::filesystem::temp_directory_path() / "drop_downloads_tests").string();
  logCfg.fileName = "tests.log";
  logCfg.minLevel = utils::LogLevel::DEBUG;
  logCfg.toConsole = false;
  utils::Logger::initialize(logCfg);

  return Catch::Session().run(argc, argv);
}

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "fakes.hpp"
#include "logger.hpp"
#include "tbb_manager.hpp"
#include "timer.hpp"

using utils::LogLevel;
using utils::TBBManager;
using utils::Timer;

TEST_CASE("log levels parse case insensitively") {
  REQUIRE(utils::Logger::parseLevel("DEBUG") == LogLevel::DEBUG);
  REQUIRE(utils::Logger::parseLevel("warning") == LogLevel::WARN);
  REQUIRE(utils::Logger::parseLevel("Error") == LogLevel::ERROR);
  REQUIRE(utils::Logger::parseLevel("chatty") == LogLevel::INFO);
}

TEST_CASE("arena settings skip malformed entries") {
  auto defines =
      TBBManager::ParseParallelCountDefines("allocate:4,bad,verify:x,:3,io:2");
  REQUIRE(defines.size() == 2);
  REQUIRE(defines["allocate"] == 4);
  REQUIRE(defines["io"] == 2);
}

TEST_CASE("parallel for visits every index") {
  std::atomic<int> sum{0};
  TBBManager::GetInstance().ParallelFor<int>(
      "test_sum", 0, 100, [&sum](int i) { sum += i; });
  REQUIRE(sum == 4950);
  REQUIRE(TBBManager::GetInstance().Concurrency("test_sum") > 0);
}

TEST_CASE("parallel for rethrows after running the other tasks") {
  std::atomic<int> ran{0};
  REQUIRE_THROWS_AS(TBBManager::GetInstance().ParallelFor<int>(
                        "test_throw", 0, 10,
                        [&ran](int i) {
                          ran++;
                          if (i == 3) throw std::runtime_error("boom");
                        }),
                    std::runtime_error);
  REQUIRE(ran == 10);
}

TEST_CASE("timer runs once and periodic tasks") {
  std::atomic<int> once{0};
  std::atomic<int> periodic{0};
  Timer timer;
  timer.addOnceTask(std::chrono::milliseconds(1), [&once]() { once++; });
  timer.addPeriodicTask(std::chrono::milliseconds(1),
                        std::chrono::milliseconds(2),
                        [&periodic]() { periodic++; });
  timer.start();
  REQUIRE(timer.running());

  REQUIRE(fakes::waitUntil([&]() { return periodic >= 3; }));
  timer.stop();
  REQUIRE_FALSE(timer.running());
  REQUIRE(once == 1);
}

TEST_CASE("cancelled timer tasks stop firing") {
  std::atomic<int> count{0};
  Timer timer;
  auto id = timer.addPeriodicTask(std::chrono::milliseconds(1),
                                  std::chrono::milliseconds(1),
                                  [&count]() { count++; });
  timer.start();
  REQUIRE(fakes::waitUntil([&]() { return count >= 1; }));

  timer.cancel(id);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  int after = count;
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  REQUIRE(count == after);
}

TEST_CASE("timer survives a throwing task") {
  std::atomic<bool> ran{false};
  Timer timer;
  timer.addOnceTask(std::chrono::milliseconds(1),
                    []() { throw std::runtime_error("task failed"); });
  timer.addOnceTask(std::chrono::milliseconds(5), [&ran]() { ran = true; });
  timer.start();
  REQUIRE(fakes::waitUntil([&]() { return ran.load(); }));
}

#include <catch2/catch.hpp>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "ControlFlag.hpp"
#include "ProgressObject.hpp"

using downloads::ControlFlag;
using downloads::ControlState;
using downloads::ProgressObject;
using downloads::ProgressSlot;

TEST_CASE("control flag keeps the last written state") {
  ControlFlag flag;
  REQUIRE(flag.get() == ControlState::Go);

  flag.set(ControlState::Pause);
  flag.set(ControlState::Stop);
  REQUIRE(flag.get() == ControlState::Stop);

  flag.set(ControlState::Go);
  REQUIRE(flag.get() == ControlState::Go);

  ControlFlag stopped(ControlState::Stop);
  REQUIRE(stopped.get() == ControlState::Stop);
  REQUIRE(std::string(downloads::controlStateName(ControlState::Pause)) ==
          "Pause");
}

TEST_CASE("progress object accumulates from concurrent writers") {
  ProgressObject progress(4000);
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&progress]() {
      for (int i = 0; i < 1000; ++i) progress.add(1);
    });
  }
  for (auto& w : writers) w.join();

  auto snap = progress.snapshot();
  REQUIRE(snap.current == 4000);
  REQUIRE(snap.total == 4000);
  REQUIRE(snap.fraction() == Approx(1.0));
}

TEST_CASE("progress can be rewound and retargeted") {
  ProgressObject progress;
  REQUIRE(progress.snapshot().fraction() == 0.0);

  progress.setTotal(200);
  progress.add(150);
  progress.set(50);
  REQUIRE(progress.current() == 50);
  REQUIRE(progress.snapshot().fraction() == Approx(0.25));
}

TEST_CASE("progress slot is empty until bound") {
  ProgressSlot slot;
  REQUIRE_FALSE(slot.bound());
  REQUIRE_FALSE(slot.snapshot().has_value());

  auto progress = std::make_shared<ProgressObject>(10);
  progress->add(3);
  slot.bind(progress);
  REQUIRE(slot.bound());
  REQUIRE(slot.snapshot()->current == 3);

  progress->add(2);
  REQUIRE(slot.snapshot()->current == 5);

  slot.clear();
  REQUIRE_FALSE(slot.snapshot().has_value());
}

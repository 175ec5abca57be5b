#include <catch2/catch.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "DownloadPipeline.hpp"
#include "fakes.hpp"

using downloads::ControlFlag;
using downloads::ControlState;
using downloads::DropDownloadPipeline;
using downloads::DropWriter;
using downloads::PipelineOptions;
using downloads::ProgressObject;

namespace {

PipelineOptions smallOptions() {
  PipelineOptions options;
  options.copyBufferSize = 4;
  options.writerBufferSize = 16;
  options.pollInterval = std::chrono::milliseconds(1);
  return options;
}

}  // namespace

TEST_CASE("pipeline copies exactly size bytes") {
  fakes::TempDir dir;
  auto path = dir.path() / "out.bin";
  auto control = std::make_shared<ControlFlag>();
  auto progress = std::make_shared<ProgressObject>(10);

  DropWriter writer(path, 16);
  DropDownloadPipeline pipeline(writer, control, progress, 10, smallOptions());

  REQUIRE(pipeline.feed("01234", 5));
  // 多余的数据被丢弃
  REQUIRE_FALSE(pipeline.feed("56789EXTRA", 10));
  REQUIRE(pipeline.complete());
  REQUIRE(pipeline.copied() == 10);
  REQUIRE(progress->current() == 10);
  REQUIRE(pipeline.finish() == fakes::md5Hex("0123456789"));
  REQUIRE(fakes::readFile(path) == "0123456789");
}

TEST_CASE("pipeline stopped before the first copy writes nothing") {
  fakes::TempDir dir;
  auto path = dir.path() / "out.bin";
  auto control = std::make_shared<ControlFlag>(ControlState::Stop);
  auto progress = std::make_shared<ProgressObject>(8);

  DropWriter writer(path, 16);
  DropDownloadPipeline pipeline(writer, control, progress, 8, smallOptions());

  REQUIRE_FALSE(pipeline.feed("abcdefgh", 8));
  REQUIRE(pipeline.stopped());
  REQUIRE(pipeline.copied() == 0);
  REQUIRE(progress->current() == 0);
}

TEST_CASE("pipeline stop takes effect between copy increments") {
  fakes::TempDir dir;
  auto path = dir.path() / "out.bin";
  auto control = std::make_shared<ControlFlag>();
  auto progress = std::make_shared<ProgressObject>(12);

  DropWriter writer(path, 16);
  DropDownloadPipeline pipeline(writer, control, progress, 12, smallOptions());

  REQUIRE(pipeline.feed("abcd", 4));
  control->set(ControlState::Stop);
  REQUIRE_FALSE(pipeline.feed("efghijkl", 8));
  REQUIRE(pipeline.copied() == 4);
  REQUIRE_FALSE(pipeline.complete());
  REQUIRE_FALSE(pipeline.checkControl());
}

TEST_CASE("pipeline waits while paused") {
  fakes::TempDir dir;
  auto path = dir.path() / "out.bin";
  auto control = std::make_shared<ControlFlag>(ControlState::Pause);
  auto progress = std::make_shared<ProgressObject>(8);

  DropWriter writer(path, 16);
  DropDownloadPipeline pipeline(writer, control, progress, 8, smallOptions());

  std::thread feeder([&pipeline]() { pipeline.feed("abcdefgh", 8); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(progress->current() == 0);

  control->set(ControlState::Go);
  feeder.join();
  REQUIRE(pipeline.complete());
  REQUIRE(progress->current() == 8);
}

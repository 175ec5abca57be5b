#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include "DownloadError.hpp"
#include "Manifest.hpp"
#include "fakes.hpp"

using downloads::DownloadError;

namespace {

const char* kManifest = R"({
  "game.exe": {
    "permissions": 493,
    "ids": ["c0", "c1"],
    "checksums": ["aa", "bb"],
    "lengths": [4, 6]
  },
  "data/level1.pak": {
    "permissions": 420,
    "ids": ["c2"],
    "checksums": ["cc"],
    "lengths": [5]
  }
})";

}  // namespace

TEST_CASE("manifest parses files and chunks") {
  auto manifest = downloads::parseManifest(kManifest);
  REQUIRE(manifest.size() == 2);

  const auto& exe = manifest.at("game.exe");
  REQUIRE(exe.permissions == 0755);
  REQUIRE(exe.checksums == std::vector<std::string>{"aa", "bb"});
  REQUIRE(exe.lengths == std::vector<uint64_t>{4, 6});
  REQUIRE(downloads::manifestTotalBytes(manifest) == 15);
}

TEST_CASE("manifest contexts carry cumulative offsets") {
  auto manifest = downloads::parseManifest(kManifest);
  auto contexts =
      downloads::generateContexts(manifest, "g1", "1.0", "/games/g1");
  REQUIRE(contexts.size() == 3);

  // std::map 按文件名排序
  REQUIRE(contexts[0].fileName == "data/level1.pak");
  REQUIRE(contexts[0].offset == 0);
  REQUIRE(contexts[0].finalChunk);
  REQUIRE(contexts[0].path == std::filesystem::path("/games/g1/data/level1.pak"));

  REQUIRE(contexts[1].fileName == "game.exe");
  REQUIRE(contexts[1].index == 0);
  REQUIRE(contexts[1].offset == 0);
  REQUIRE_FALSE(contexts[1].finalChunk);

  REQUIRE(contexts[2].index == 1);
  REQUIRE(contexts[2].offset == 4);
  REQUIRE(contexts[2].length == 6);
  REQUIRE(contexts[2].checksum == "bb");
  REQUIRE(contexts[2].permissions == 0755);
  REQUIRE(contexts[2].finalChunk);
  REQUIRE(contexts[2].gameId == "g1");
  REQUIRE(contexts[2].version == "1.0");
}

TEST_CASE("manifest rejects malformed bodies") {
  auto expectMalformed = [](const std::string& body) {
    try {
      downloads::parseManifest(body);
      FAIL("expected DownloadError for " << body);
    } catch (const DownloadError& e) {
      REQUIRE(e.kind() == DownloadError::Kind::Communication);
      REQUIRE(e.remoteReason() == remote::RemoteReason::MalformedBody);
    }
  };

  expectMalformed("not json");
  expectMalformed("[1, 2]");
  expectMalformed(R"({"a": {"permissions": 420}})");
  expectMalformed(
      R"({"a": {"permissions": 420, "ids": ["x"], "checksums": ["x", "y"], "lengths": [1]}})");
  expectMalformed(
      R"({"../escape": {"permissions": 420, "ids": [], "checksums": [], "lengths": []}})");
  expectMalformed(
      R"({"/etc/passwd": {"permissions": 420, "ids": [], "checksums": [], "lengths": []}})");
}

TEST_CASE("allocate files creates directories and sizes files") {
  fakes::TempDir dir;
  auto manifest = downloads::parseManifest(kManifest);
  auto installDir = dir.path() / "g1";

  downloads::allocateFiles(manifest, installDir);

  REQUIRE(std::filesystem::file_size(installDir / "game.exe") == 10);
  REQUIRE(std::filesystem::file_size(installDir / "data" / "level1.pak") == 5);
}

TEST_CASE("allocate files keeps existing content of the right size") {
  fakes::TempDir dir;
  auto manifest = downloads::parseManifest(kManifest);
  auto installDir = dir.path() / "g1";
  std::filesystem::create_directories(installDir);
  {
    std::ofstream out(installDir / "game.exe", std::ios::binary);
    out << "0123456789";
  }

  downloads::allocateFiles(manifest, installDir);

  REQUIRE(fakes::readFile(installDir / "game.exe") == "0123456789");
}

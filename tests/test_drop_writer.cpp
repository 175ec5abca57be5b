#include <catch2/catch.hpp>

#include <string>

#include "DownloadError.hpp"
#include "DropWriter.hpp"
#include "fakes.hpp"

using downloads::DownloadError;
using downloads::DropWriter;
using downloads::Md5Hasher;

TEST_CASE("md5 hasher produces lowercase hex") {
  Md5Hasher hasher;
  hasher.update("ab", 2);
  hasher.update("c", 1);
  REQUIRE(hasher.finishHex() == "900150983cd24fb0d6963f7d28e17f72");
}

TEST_CASE("md5 of nothing") {
  Md5Hasher hasher;
  REQUIRE(hasher.finishHex() == "d41d8cd98f00b204e9800998ecf8427e");
  REQUIRE_THROWS_AS(hasher.finishHex(), DownloadError);
}

TEST_CASE("drop writer creates a missing file") {
  fakes::TempDir dir;
  auto path = dir.path() / "new.bin";
  {
    DropWriter writer(path, 16);
    writer.write("hello", 5);
    REQUIRE(writer.finish() == fakes::md5Hex("hello"));
    REQUIRE(writer.written() == 5);
  }
  REQUIRE(fakes::readFile(path) == "hello");
}

TEST_CASE("drop writer writes at an offset without truncating") {
  fakes::TempDir dir;
  auto path = dir.path() / "existing.bin";
  {
    std::ofstream out(path, std::ios::binary);
    out << "0123456789";
  }
  {
    DropWriter writer(path, 4);
    writer.seek(4);
    writer.write("ab", 2);
    // 摘要只覆盖本次写入的内容
    REQUIRE(writer.finish() == fakes::md5Hex("ab"));
  }
  REQUIRE(fakes::readFile(path) == "0123ab6789");
}

TEST_CASE("drop writer reports io errors") {
  fakes::TempDir dir;
  auto path = dir.path() / "missing_dir" / "file.bin";
  try {
    DropWriter writer(path, 16);
    FAIL("expected DownloadError");
  } catch (const DownloadError& e) {
    REQUIRE(e.kind() == DownloadError::Kind::Io);
  }
}

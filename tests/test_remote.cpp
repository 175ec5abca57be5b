#include <catch2/catch.hpp>

#include <string>

#include "DownloadError.hpp"
#include "Remote.hpp"
#include "UrlUtils.hpp"
#include "fakes.hpp"

using remote::RemoteAccessError;
using remote::RemoteReason;
using remote::RemoteSetupError;

TEST_CASE("join url resolves absolute paths against the base") {
  REQUIRE(remote::joinUrl("http://drop.test", "/api/v1") ==
          "http://drop.test/api/v1");
  REQUIRE(remote::joinUrl("https://drop.test:3000/ignored/path",
                          "/api/v1/client/chunk?id=1") ==
          "https://drop.test:3000/api/v1/client/chunk?id=1");
}

TEST_CASE("invalid urls are reported as remote errors") {
  try {
    remote::normalizeUrl("not a url");
    FAIL("expected RemoteAccessError");
  } catch (const RemoteAccessError& e) {
    REQUIRE(e.reason() == RemoteReason::InvalidUrl);
  }
}

TEST_CASE("url encoding escapes reserved characters") {
  REQUIRE(remote::urlEncode("1.0.2-beta_x~") == "1.0.2-beta_x~");
  REQUIRE(remote::urlEncode("a b/c&d") == "a%20b%2Fc%26d");
}

TEST_CASE("fetch text collects status and body") {
  fakes::FakeHttpClient http;
  fakes::FakeResponse response;
  response.status = 201;
  response.body = "some text body";
  response.segment = 4;
  http.route("/text", response);

  auto result = remote::fetchText(http, "http://drop.test/text");
  REQUIRE(result.status == 201);
  REQUIRE(result.body == "some text body");
}

TEST_CASE("use remote stores a verified drop instance") {
  fakes::FakeDatabase db("");
  fakes::FakeHttpClient http;
  fakes::FakeResponse response;
  response.body = R"({"appName": "Drop", "version": "0.3.0"})";
  http.route("drop.test/api/v1", response);

  auto stored = remote::useRemote(db, http, "http://drop.test");
  REQUIRE(stored == "http://drop.test/");
  REQUIRE(db.baseUrl() == "http://drop.test/");
  REQUIRE(http.requests() ==
          std::vector<std::string>{"http://drop.test/api/v1"});
}

TEST_CASE("use remote rejects servers that are not drop") {
  fakes::FakeDatabase db("");
  fakes::FakeHttpClient http;
  fakes::FakeResponse response;
  response.body = R"({"appName": "Something Else"})";
  http.route("/api/v1", response);

  try {
    remote::useRemote(db, http, "http://other.test");
    FAIL("expected RemoteSetupError");
  } catch (const RemoteSetupError& e) {
    REQUIRE(std::string(e.what()) == "Not a valid Drop endpoint");
  }
  REQUIRE(db.baseUrl().empty());
}

TEST_CASE("use remote reports unreachable or broken servers") {
  fakes::FakeDatabase db("");
  fakes::FakeHttpClient http;

  fakes::FakeResponse broken;
  broken.body = "<html>";
  http.route("broken.test", broken);
  fakes::FakeResponse down;
  down.transportError = true;
  http.route("down.test", down);

  for (const char* url :
       {"http://missing.test", "http://broken.test", "http://down.test"}) {
    try {
      remote::useRemote(db, http, url);
      FAIL("expected RemoteSetupError for " << url);
    } catch (const RemoteSetupError& e) {
      REQUIRE(std::string(e.what()).rfind(
                  "Invalid URL or Drop is inaccessible (", 0) == 0);
    }
  }
  REQUIRE(db.baseUrl().empty());
}

TEST_CASE("communication errors keep the remote reason") {
  auto error = downloads::DownloadError::communication(
      RemoteAccessError(RemoteReason::InvalidStatus, "HTTP 500", 500));
  REQUIRE(error.kind() == downloads::DownloadError::Kind::Communication);
  REQUIRE(error.remoteReason() == RemoteReason::InvalidStatus);
  REQUIRE(error.httpStatus() == 500);
  REQUIRE(std::string(error.what()) ==
          "communication error (InvalidStatus): HTTP 500");

  auto io = downloads::DownloadError::io("disk full");
  REQUIRE_FALSE(io.remoteReason().has_value());
}

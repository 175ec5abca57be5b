#include <catch2/catch.hpp>

#include <fstream>
#include <string>

#include "JsonDatabase.hpp"
#include "fakes.hpp"

using storage::DatabaseError;
using storage::GameStatus;
using storage::JsonDatabase;

TEST_CASE("game status names round trip") {
  for (auto status : {GameStatus::Remote, GameStatus::Queued,
                      GameStatus::Downloading, GameStatus::Installed,
                      GameStatus::Error}) {
    REQUIRE(storage::parseGameStatus(storage::gameStatusName(status)) ==
            status);
  }
  REQUIRE_FALSE(storage::parseGameStatus("Bogus").has_value());
}

TEST_CASE("json database starts empty when the file is missing") {
  fakes::TempDir dir;
  JsonDatabase db((dir.path() / "db.json").string());
  REQUIRE(db.baseUrl().empty());
  REQUIRE_FALSE(db.gameStatus("g1").has_value());
}

TEST_CASE("json database persists base url and statuses") {
  fakes::TempDir dir;
  auto path = (dir.path() / "db.json").string();
  {
    JsonDatabase db(path);
    db.setBaseUrl("http://drop.test/");
    db.setGameStatus("g1", GameStatus::Installed);
    db.setGameStatus("g2", GameStatus::Queued);
    db.setGameStatus("g2", GameStatus::Error);
  }

  JsonDatabase reloaded(path);
  REQUIRE(reloaded.baseUrl() == "http://drop.test/");
  REQUIRE(reloaded.gameStatus("g1") == GameStatus::Installed);
  REQUIRE(reloaded.gameStatus("g2") == GameStatus::Error);
  REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_CASE("json database skips unknown statuses") {
  fakes::TempDir dir;
  auto path = dir.path() / "db.json";
  {
    std::ofstream out(path);
    out << R"({"base_url": "http://x/", "games": {"statuses": )"
        << R"({"g1": "Installed", "g2": "Exploded", "g3": 7}}})";
  }

  JsonDatabase db(path.string());
  REQUIRE(db.gameStatus("g1") == GameStatus::Installed);
  REQUIRE_FALSE(db.gameStatus("g2").has_value());
  REQUIRE_FALSE(db.gameStatus("g3").has_value());
}

TEST_CASE("json database rejects a corrupt file") {
  fakes::TempDir dir;
  auto path = dir.path() / "db.json";
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  REQUIRE_THROWS_AS(JsonDatabase(path.string()), DatabaseError);
}

#include "Remote.hpp"

#include <nlohmann/json.hpp>

#include "UrlUtils.hpp"
#include "logger.hpp"

namespace remote {

std::string useRemote(storage::Database& db, HttpClient& client,
                      const std::string& url) {
  LOG(INFO) << "[Remote] Connecting to url " << url;

  std::string baseUrl;
  std::string appName;
  try {
    baseUrl = normalizeUrl(url);
    HttpTextResponse response = fetchText(client, joinUrl(baseUrl, "/api/v1"));
    if (response.status != 200) {
      throw RemoteAccessError(RemoteReason::InvalidStatus,
                              "HTTP " + std::to_string(response.status),
                              response.status);
    }
    auto healthcheck = nlohmann::json::parse(response.body);
    appName = healthcheck.at("appName").get<std::string>();
  } catch (const RemoteAccessError& e) {
    throw RemoteSetupError(
        std::string("Invalid URL or Drop is inaccessible (") + e.what() + ")");
  } catch (const nlohmann::json::exception& e) {
    throw RemoteSetupError(
        std::string("Invalid URL or Drop is inaccessible (") + e.what() + ")");
  }

  if (appName != "Drop") {
    throw RemoteSetupError("Not a valid Drop endpoint");
  }

  db.setBaseUrl(baseUrl);
  LOG(INFO) << "[Remote] Using Drop instance at " << baseUrl;
  return baseUrl;
}

}  // namespace remote

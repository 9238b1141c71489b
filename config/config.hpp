#pragma once
#include <drogon/drogon.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <string>

namespace config {

inline const std::string DEFAULT_S3_ENDPOINT = "https://s3.amazonaws.com";
inline const std::string DEFAULT_S3_REGION = "us-east-1";
// Selects report-only freshness checks when a request omits max_age
inline const std::string REPORT_ONLY_MAX_AGE = "none";
// Fallback listener port when the config file declares no listeners
inline constexpr std::uint16_t DEFAULT_PORT = 8000;

inline std::string get_config_value(const std::string &key,
                                    const std::string &default_value) {
  const Json::Value &config = drogon::app().getCustomConfig();
  if (config.isMember(key)) {
    return config[key].asString();
  }
  return default_value;
}

inline std::int64_t get_config_int(const std::string &key,
                                   std::int64_t default_value) {
  const Json::Value &config = drogon::app().getCustomConfig();
  if (config.isMember(key) && config[key].isIntegral()) {
    return config[key].asInt64();
  }
  return default_value;
}

inline bool get_config_bool(const std::string &key, bool default_value) {
  const Json::Value &config = drogon::app().getCustomConfig();
  if (config.isMember(key) && config[key].isBool()) {
    return config[key].asBool();
  }
  return default_value;
}

// Environment variables win over the config file; empty ones are ignored
inline std::string get_env_or_config_value(const char *env_name,
                                           const std::string &key,
                                           const std::string &default_value) {
  if (const char *value = std::getenv(env_name);
      value != nullptr && *value != '\0') {
    return value;
  }
  return get_config_value(key, default_value);
}

// Whether a Drogon config file has a non-empty "listeners" array
inline bool declares_listeners(const std::string &config_path) {
  std::ifstream file(config_path);
  if (!file) {
    return false;
  }
  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errors;
  if (!Json::parseFromStream(builder, file, &root, &errors)) {
    return false;
  }
  const Json::Value &listeners = root["listeners"];
  return listeners.isArray() && !listeners.empty();
}

}  // namespace config

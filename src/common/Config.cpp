#include "common/Config.hpp"

#include "common/Errors.hpp"

#include <array>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace roommates::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

bool Config::isKnownLogLevel(const std::string& sLevel) {
  static const std::array<const char*, 7> kLevels = {
      "trace", "debug", "info", "warn", "error", "critical", "off"};
  for (const char* pLevel : kLevels) {
    if (sLevel == pLevel) return true;
  }
  return false;
}

std::string Config::loadWithFileFallback(const char* pVarName) {
  // Try the direct env var first
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    throw ConfigError("config_missing",
                      std::string("Required setting not set: neither ") + pVarName +
                          " nor " + sFileVar + " is defined");
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw ConfigError("config_missing", std::string("Cannot open file specified by ") +
                                            sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw ConfigError("config_invalid",
                      "File is empty: " + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

Config Config::load() {
  Config cfg;

  cfg.sDbUrl = loadWithFileFallback("ROOMMATES_DB_URL");

  const std::string sLogLevel = getEnv("ROOMMATES_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // spdlog::level::from_str maps unknown names to "off"; reject them here
  if (!isKnownLogLevel(cfg.sLogLevel)) {
    throw ConfigError("config_invalid",
                      "ROOMMATES_LOG_LEVEL is not a valid level: " + cfg.sLogLevel);
  }

  return cfg;
}

}  // namespace roommates::common

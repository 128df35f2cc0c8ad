#include "common/Logger.hpp"

#include "common/Config.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace roommates::common {

bool Logger::_bInitialized = false;

void Logger::init(const std::string& sLevel) {
  const auto level = spdlog::level::from_str(sLevel);
  if (_bInitialized) {
    spdlog::default_logger()->set_level(level);
    return;
  }

  auto spLogger = spdlog::stdout_color_mt("roommates");
  spLogger->set_pattern("%Y-%m-%dT%H:%M:%S.%e %^%-5l%$ [%n] %v");
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);
  _bInitialized = true;
}

void Logger::init(const Config& cfg) { init(cfg.sLogLevel); }

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

std::string Logger::redactDbUrl(const std::string& sDbUrl) {
  const auto nScheme = sDbUrl.find("://");
  if (nScheme == std::string::npos) return "<keyword/value string>";

  // User-info lives in the authority, which ends at the first '/', '?' or '#'
  const auto nAuthority = nScheme + 3;
  auto nAuthorityEnd = sDbUrl.find_first_of("/?#", nAuthority);
  if (nAuthorityEnd == std::string::npos) nAuthorityEnd = sDbUrl.size();

  const auto nAt = sDbUrl.rfind('@', nAuthorityEnd - 1);
  if (nAt == std::string::npos || nAt < nAuthority) return sDbUrl;
  return sDbUrl.substr(0, nAuthority) + "***" + sDbUrl.substr(nAt);
}

}  // namespace roommates::common

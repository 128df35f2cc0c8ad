#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace roommates::common {

struct Config;

/// Process-wide spdlog logger named "roommates", installed as spdlog's
/// default logger so it outlives any static that logs from a destructor.
/// Class abbreviation: N/A (static interface)
class Logger {
 public:
  /// Install the logger at sLevel, or only change the level if it is
  /// already installed.
  static void init(const std::string& sLevel);

  /// Same as init(cfg.sLogLevel).
  static void init(const Config& cfg);

  /// Installs the logger at "info" on first use.
  static std::shared_ptr<spdlog::logger> get();

  /// Connection URI with its user-info part replaced by "***".
  /// Keyword/value connection strings are not logged at all.
  static std::string redactDbUrl(const std::string& sDbUrl);

 private:
  static bool _bInitialized;
};

}  // namespace roommates::common

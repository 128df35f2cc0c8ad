#pragma once

#include <string>

namespace roommates::common {

/// Environment variable loader for the room store.
/// Loads all env vars into a typed struct with validation; the struct is
/// passed explicitly to whatever needs it.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sDbUrl;  // libpq connection URI

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for ROOMMATES_DB_URL.
  /// Throws ConfigError on missing required vars or invalid values.
  static Config load();

 private:
  /// Read an env var with _FILE fallback.
  /// If varName is unset, tries varName + "_FILE" and reads file contents.
  /// Trims trailing whitespace/newlines from file contents.
  static std::string loadWithFileFallback(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// True if sLevel names a spdlog level.
  static bool isKnownLogLevel(const std::string& sLevel);
};

}  // namespace roommates::common

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace roommates::common {

/// Base error for all application-level exceptions.
/// Carries a machine-readable error code slug.
/// Driver exceptions (pqxx::sql_error, pqxx::broken_connection) are not
/// wrapped and reach callers unchanged.
struct AppError : public std::runtime_error {
  std::string _sErrorCode;

  explicit AppError(std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)), _sErrorCode(std::move(sCode)) {}
};

/// Configuration missing or invalid at load time.
struct ConfigError : AppError {
  explicit ConfigError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg)) {}
};

}  // namespace roommates::common

#pragma once

#include <memory>
#include <string>

#include <pqxx/pqxx>

namespace roommates::common {
struct Config;
}  // namespace roommates::common

namespace roommates::dal {

/// RAII owner of one freshly opened database connection.
/// Closes the connection on destruction.
/// Class abbreviation: cg
class ConnectionGuard {
 public:
  explicit ConnectionGuard(std::unique_ptr<pqxx::connection> upConn);
  ~ConnectionGuard();

  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
  ConnectionGuard(ConnectionGuard&& other) noexcept;
  ConnectionGuard& operator=(ConnectionGuard&& other) noexcept;

  pqxx::connection& operator*();
  pqxx::connection* operator->();

 private:
  std::unique_ptr<pqxx::connection> _upConn;
};

/// Opens one new pqxx::connection per call from the configured libpq URI.
/// Holds no connections itself; nothing is shared or reused between calls.
/// Class abbreviation: cf
class ConnectionFactory {
 public:
  explicit ConnectionFactory(const common::Config& cfg);
  ~ConnectionFactory();

  /// Open a new connection. Driver failures (pqxx::broken_connection)
  /// propagate unchanged.
  ConnectionGuard open();

  const std::string& url() const { return _sDbUrl; }

 private:
  std::string _sDbUrl;
};

}  // namespace roommates::dal

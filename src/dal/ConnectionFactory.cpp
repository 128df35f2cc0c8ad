#include "dal/ConnectionFactory.hpp"

#include "common/Config.hpp"
#include "common/Logger.hpp"

#include <utility>

namespace roommates::dal {

// ── ConnectionGuard ────────────────────────────────────────────────────────

ConnectionGuard::ConnectionGuard(std::unique_ptr<pqxx::connection> upConn)
    : _upConn(std::move(upConn)) {}

ConnectionGuard::~ConnectionGuard() = default;

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : _upConn(std::move(other._upConn)) {}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
  if (this != &other) {
    _upConn = std::move(other._upConn);
  }
  return *this;
}

pqxx::connection& ConnectionGuard::operator*() { return *_upConn; }
pqxx::connection* ConnectionGuard::operator->() { return _upConn.get(); }

// ── ConnectionFactory ──────────────────────────────────────────────────────

ConnectionFactory::ConnectionFactory(const common::Config& cfg) : _sDbUrl(cfg.sDbUrl) {
  common::Logger::get()->info("Connection factory configured: url={}",
                              common::Logger::redactDbUrl(_sDbUrl));
}

ConnectionFactory::~ConnectionFactory() = default;

ConnectionGuard ConnectionFactory::open() {
  // pqxx::connection throws pqxx::broken_connection if the server is unreachable
  return ConnectionGuard(std::make_unique<pqxx::connection>(_sDbUrl));
}

}  // namespace roommates::dal

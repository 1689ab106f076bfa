#include "rsvp/store/connection_pool.hpp"

#include <iostream>
#include <utility>

namespace rsvp {

// =============================================================================
// Lease
// =============================================================================

ConnectionPool::Lease::Lease(ConnectionPool& pool,
                             std::unique_ptr<Connection> connection)
    : pool_(&pool), connection_(std::move(connection)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)) {}

ConnectionPool::Lease::~Lease() {
  if (connection_) {
    pool_->release(std::move(connection_));
  }
}

// =============================================================================
// ConnectionPool
// =============================================================================

ConnectionPool::ConnectionPool(std::string database_path, int busy_timeout_ms)
    : database_path_(std::move(database_path)),
      busy_timeout_ms_(busy_timeout_ms) {}

// -----------------------------------------------------------------------------
// acquire(): reuse an idle connection or open a new one
// -----------------------------------------------------------------------------
ConnectionPool::Lease ConnectionPool::acquire() {
  if (auto idle = idle_.try_pop()) {
    return Lease(*this, std::move(*idle));
  }

  auto connection =
      std::make_unique<Connection>(database_path_, busy_timeout_ms_);
  opened_.fetch_add(1);
  return Lease(*this, std::move(connection));
}

// -----------------------------------------------------------------------------
// release(): park the connection unless it still holds a transaction
// -----------------------------------------------------------------------------
void ConnectionPool::release(std::unique_ptr<Connection> connection) {
  if (!connection->inAutocommit()) {
    std::cerr << "[ConnectionPool] WARNING: connection returned with an "
                 "open transaction. Closing it.\n";
    return;
  }
  idle_.push(std::move(connection));
}

}  // namespace rsvp

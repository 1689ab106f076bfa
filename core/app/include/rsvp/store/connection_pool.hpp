#pragma once

#include "rsvp/concurrent/thread_safe_queue.hpp"
#include "rsvp/store/connection.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// ConnectionPool: unbounded pool of SQLite connections to one database
// -----------------------------------------------------------------------------
//
// @brief  Hands out Connection leases to concurrent request handlers.
//
// @details
// acquire() reuses an idle connection if one is parked in the queue and
// otherwise opens a new one, so the pool never makes a handler wait for
// another handler to finish. All serialization of seat state happens inside
// the datastore (transaction locks), never here.
//
// A Lease returns its connection on destruction. A connection that still
// has an open transaction at that point (which RAII Transactions prevent)
// is closed instead of being reused.
//
// Thread model: acquire() and Lease destruction are safe from any thread.
// Ownership:    The pool owns idle connections; a Lease owns its connection
//               while held. The pool must outlive every Lease.
// -----------------------------------------------------------------------------
class ConnectionPool {
 public:
  class Lease {
   public:
    Lease(ConnectionPool& pool, std::unique_ptr<Connection> connection);
    ~Lease();

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&&) = delete;

    Connection& operator*() const { return *connection_; }
    Connection* operator->() const { return connection_.get(); }

   private:
    ConnectionPool* pool_;
    std::unique_ptr<Connection> connection_;
  };

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  database_path    SQLite file shared by every connection (and by
  //                          other server processes).
  // @param  busy_timeout_ms  Upper bound on any datastore lock wait.
  //
  // No connection is opened until the first acquire().
  // -------------------------------------------------------------------------
  ConnectionPool(std::string database_path, int busy_timeout_ms);

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;
  ConnectionPool(ConnectionPool&&) = delete;
  ConnectionPool& operator=(ConnectionPool&&) = delete;

  // Throws StoreError if a new connection cannot be opened.
  Lease acquire();

  std::size_t idleCount() const { return idle_.size(); }
  std::size_t openedCount() const { return opened_.load(); }

  const std::string& databasePath() const { return database_path_; }

 private:
  void release(std::unique_ptr<Connection> connection);

  std::string database_path_;
  int busy_timeout_ms_;
  ThreadSafeQueue<std::unique_ptr<Connection>> idle_;
  std::atomic<std::size_t> opened_{0};
};

}  // namespace rsvp

#pragma once

#include "rsvp/store/connection.hpp"

namespace rsvp {

// -----------------------------------------------------------------------------
// Transaction: RAII scope for one SQLite transaction
// -----------------------------------------------------------------------------
//
// @brief  Issues BEGIN on construction and ROLLBACK on destruction unless
//         commit() succeeded first.
//
// @details
// Every early return or exception inside a transaction scope therefore
// aborts cleanly: no partial mutation becomes visible to other connections.
//
// Modes:
//   Deferred   BEGIN DEFERRED. Takes no lock until the first read/write.
//              For read-only work.
//   Immediate  BEGIN IMMEDIATE. Acquires the database write lock up front,
//              waiting up to the connection's busy timeout. Every
//              transaction that mutates seat state uses this mode, so all
//              such transactions are totally ordered by lock acquisition.
//
// A failed COMMIT (e.g. SQLITE_BUSY) throws StoreError and leaves the
// transaction open; the destructor then rolls it back.
//
// Thread model: Same thread as the owning Connection.
// Ownership:    Borrows the Connection, which must outlive the Transaction.
// -----------------------------------------------------------------------------
class Transaction {
 public:
  enum class Mode {
    Deferred,
    Immediate,
  };

  explicit Transaction(Connection& connection, Mode mode = Mode::Immediate);

  // Rolls back if still active. Never throws; rollback failures are logged.
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;

  void commit();
  void rollback();

  bool isActive() const { return active_; }

  Connection& connection() { return connection_; }

 private:
  Connection& connection_;
  bool active_{false};
};

}  // namespace rsvp

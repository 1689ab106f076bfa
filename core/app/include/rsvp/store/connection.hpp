#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// Statement: RAII wrapper around a prepared sqlite3_stmt
// -----------------------------------------------------------------------------
//
// @brief  Owns one prepared statement; binds parameters, steps through rows,
//         and finalizes on destruction.
//
// @details
// Parameter indices are 1-based (SQLite convention), column indices are
// 0-based. bind() returns *this so calls can be chained:
//
//   auto stmt = conn.prepare("SELECT name FROM users WHERE id = ?");
//   stmt.bind(1, user_id);
//   if (stmt.step()) { name = stmt.columnText(0); }
//
// Every SQLite error is converted to StoreError carrying the extended
// result code of the owning connection.
//
// Thread model: Belongs to the thread that owns the Connection.
// Ownership:    Move-only. Must not outlive its Connection.
// -----------------------------------------------------------------------------
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql);
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&& other) noexcept;
  Statement& operator=(Statement&& other) noexcept;

  Statement& bind(int index, std::int64_t value);
  Statement& bind(int index, const std::string& value);

  // -------------------------------------------------------------------------
  // step()
  // -------------------------------------------------------------------------
  // @brief  Advances the statement by one row.
  //
  // @return true if a result row is available (SQLITE_ROW), false when the
  //         statement has run to completion (SQLITE_DONE).
  //
  // @details
  // Any other result code (BUSY, CONSTRAINT, IOERR, ...) throws StoreError.
  // A BUSY result here means the connection's busy timeout has already
  // expired while waiting for the datastore lock.
  // -------------------------------------------------------------------------
  bool step();

  // Steps until SQLITE_DONE. For INSERT / UPDATE / DELETE.
  void run();

  std::int64_t columnInt64(int column) const;
  int columnInt(int column) const;
  std::string columnText(int column) const;

 private:
  [[noreturn]] void fail(const char* what) const;

  sqlite3* db_{nullptr};
  sqlite3_stmt* stmt_{nullptr};
};

// -----------------------------------------------------------------------------
// Connection: one RAII SQLite database handle
// -----------------------------------------------------------------------------
//
// @brief  Opens (creating if necessary) the database file, configures the
//         busy timeout and foreign-key enforcement, and closes the handle on
//         destruction.
//
// @details
// One Connection carries at most one open transaction at a time. Request
// handlers never share a Connection concurrently: they lease one from the
// ConnectionPool for the duration of an operation.
//
// busy_timeout_ms bounds every wait on the datastore lock. When the lock
// cannot be acquired in time SQLite returns SQLITE_BUSY, which surfaces as a
// transient StoreError instead of blocking forever.
//
// Thread model: Opened with SQLITE_OPEN_NOMUTEX. Use from one thread at a
//               time; handing a Connection to another thread between
//               operations (as the pool does) is fine.
// Ownership:    Non-copyable, non-movable. Held by std::unique_ptr in the
//               ConnectionPool.
// -----------------------------------------------------------------------------
class Connection {
 public:
  Connection(const std::string& path, int busy_timeout_ms);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;
  Connection(Connection&&) = delete;
  Connection& operator=(Connection&&) = delete;

  // Executes one or more SQL statements that return no rows of interest.
  void exec(const std::string& sql);

  Statement prepare(const std::string& sql);

  // Row id of the most recent successful INSERT on this connection.
  std::int64_t lastInsertRowId() const;

  // Rows modified by the most recent INSERT / UPDATE / DELETE.
  int changes() const;

  // False while a transaction is open on this connection.
  bool inAutocommit() const;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  sqlite3* db_{nullptr};
};

}  // namespace rsvp

#include "rsvp/store/transaction.hpp"
#include "rsvp/store/store_error.hpp"

#include <iostream>

namespace rsvp {

// -----------------------------------------------------------------------------
// Constructor: BEGIN in the requested mode
// -----------------------------------------------------------------------------
Transaction::Transaction(Connection& connection, Mode mode)
    : connection_(connection) {
  connection_.exec(mode == Mode::Immediate ? "BEGIN IMMEDIATE"
                                           : "BEGIN DEFERRED");
  active_ = true;
}

// -----------------------------------------------------------------------------
// Destructor: RAII rollback
// -----------------------------------------------------------------------------
Transaction::~Transaction() {
  if (!active_) {
    return;
  }
  try {
    rollback();
  } catch (const StoreError& e) {
    std::cerr << "[Transaction] rollback failed on " << connection_.path()
              << ": " << e.what() << "\n";
  }
}

void Transaction::commit() {
  connection_.exec("COMMIT");
  active_ = false;
}

// -----------------------------------------------------------------------------
// rollback(): skip when SQLite already rolled back on its own
// -----------------------------------------------------------------------------
void Transaction::rollback() {
  active_ = false;
  // Some errors (SQLITE_FULL, SQLITE_IOERR, ...) make SQLite roll back
  // automatically; a second ROLLBACK would then fail with "no transaction
  // is active".
  if (connection_.inAutocommit()) {
    return;
  }
  connection_.exec("ROLLBACK");
}

}  // namespace rsvp

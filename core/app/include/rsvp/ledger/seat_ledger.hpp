#pragma once

#include "rsvp/domain/event.hpp"
#include "rsvp/store/connection.hpp"
#include "rsvp/store/transaction.hpp"

#include <optional>

namespace rsvp {

// -----------------------------------------------------------------------------
// SeatLedger: durable per-event seat counter
// -----------------------------------------------------------------------------
//
// @brief  The only code path that writes events.available_seats after an
//         event is created.
//
// @details
// Every mutating operation runs inside the caller's Transaction and is a
// single SQL statement evaluated by the datastore, never a read-then-write
// in application code:
//
//   reserve()        UPDATE events SET available_seats = available_seats - 1
//                    WHERE id = ? AND available_seats > 0
//   release()        UPDATE events SET available_seats = available_seats + 1
//                    WHERE id = ?
//   lockForUpdate()  UPDATE events SET available_seats = available_seats
//                    WHERE id = ?        (take the write lock)
//                    SELECT ... FROM events WHERE id = ?
//
// reserve() is safe without any external lock: the guard predicate is
// checked by the store at write time, so two concurrent reserves can never
// both take the last seat. release() relies on the schema CHECK
// (available_seats <= capacity) as its bound.
//
// Locking: SQLite's write lock covers the whole database file, which is at
// least as strong as the row lock the reservation protocol needs. Inside a
// Transaction opened with Mode::Immediate the lock is already held and
// lockForUpdate() only re-reads the row. Inside a Mode::Deferred
// transaction the no-op UPDATE is what acquires it. It waits up to the
// connection's busy timeout only when it is the transaction's first
// statement. After an earlier read the busy handler is not consulted: the
// upgrade fails at once with SQLITE_BUSY while another writer holds the
// lock, or SQLITE_BUSY_SNAPSHOT if one has committed since the read.
// Reservation transactions are therefore opened Immediate.
//
// Thread model: Stateless. One SeatLedger is shared by all request handlers;
//               the Transaction argument carries the per-thread connection.
// Failure:      Store errors (busy timeout, I/O, CHECK violation) throw
//               StoreError. Business results are returned as Status values.
// -----------------------------------------------------------------------------
class SeatLedger {
 public:
  enum class Status {
    Ok,              // The write affected exactly one row.
    SeatsExhausted,  // reserve(): event exists but available_seats was 0.
    NotFound,        // No events row with that id.
  };

  SeatLedger() = default;

  // -------------------------------------------------------------------------
  // reserve(tx, event_id)
  // -------------------------------------------------------------------------
  // @brief  Conditional decrement of available_seats.
  //
  // @return Ok if one seat was taken. SeatsExhausted if the guard
  //         (available_seats > 0) was false at the instant of the write.
  //         NotFound if the event does not exist.
  //
  // @details
  // The zero-rows case is disambiguated with an existence check inside the
  // same transaction, so SeatsExhausted and NotFound are never confused.
  // -------------------------------------------------------------------------
  Status reserve(Transaction& tx, domain::EventId event_id) const;

  // -------------------------------------------------------------------------
  // release(tx, event_id)
  // -------------------------------------------------------------------------
  // @brief  Unconditional increment of available_seats.
  //
  // @return Ok, or NotFound if the event does not exist.
  //
  // @details
  // Callers release only a seat they have just proven was reserved (by
  // deleting its registration in the same transaction). Releasing past
  // capacity violates the schema CHECK and throws StoreError.
  // -------------------------------------------------------------------------
  Status release(Transaction& tx, domain::EventId event_id) const;

  // -------------------------------------------------------------------------
  // lockForUpdate(tx, event_id)
  // -------------------------------------------------------------------------
  // @brief  Acquires the exclusive write lock covering the event's row and
  //         returns the row as seen under that lock.
  //
  // @return The locked row, or std::nullopt if the event does not exist.
  //
  // @details
  // Blocks while another transaction holds the lock. Competing callers
  // proceed in the order SQLite grants the lock, one at a time, each only
  // after the previous holder commits or rolls back. A wait longer than the
  // busy timeout throws a transient StoreError.
  // -------------------------------------------------------------------------
  std::optional<domain::Event> lockForUpdate(Transaction& tx,
                                             domain::EventId event_id) const;

  // Read-only view of the ledger row outside any reservation transaction.
  // For reporting only; never feed it back into a reservation decision.
  std::optional<domain::Event> snapshot(Connection& connection,
                                        domain::EventId event_id) const;
};

const char* ledgerStatusToString(SeatLedger::Status status);

}  // namespace rsvp

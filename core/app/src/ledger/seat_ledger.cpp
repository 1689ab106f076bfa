#include "rsvp/ledger/seat_ledger.hpp"

namespace rsvp {

namespace {

constexpr const char* kSelectEvent =
    "SELECT id, title, capacity, available_seats, organizer_id, created_at_ms "
    "FROM events WHERE id = ?";

std::optional<domain::Event> readEvent(Connection& connection,
                                       domain::EventId event_id) {
  Statement stmt = connection.prepare(kSelectEvent);
  stmt.bind(1, event_id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  domain::Event event;
  event.id = stmt.columnInt64(0);
  event.title = stmt.columnText(1);
  event.capacity = stmt.columnInt(2);
  event.available_seats = stmt.columnInt(3);
  event.organizer_id = stmt.columnInt64(4);
  event.created_at_ms = stmt.columnInt64(5);
  return event;
}

bool eventExists(Connection& connection, domain::EventId event_id) {
  Statement stmt = connection.prepare("SELECT 1 FROM events WHERE id = ?");
  stmt.bind(1, event_id);
  return stmt.step();
}

}  // namespace

// -----------------------------------------------------------------------------
// reserve(): conditional decrement, evaluated by SQLite at write time
// -----------------------------------------------------------------------------
SeatLedger::Status SeatLedger::reserve(Transaction& tx,
                                       domain::EventId event_id) const {
  Connection& connection = tx.connection();
  connection
      .prepare(
          "UPDATE events SET available_seats = available_seats - 1 "
          "WHERE id = ? AND available_seats > 0")
      .bind(1, event_id)
      .run();

  if (connection.changes() == 1) {
    return Status::Ok;
  }
  return eventExists(connection, event_id) ? Status::SeatsExhausted
                                           : Status::NotFound;
}

// -----------------------------------------------------------------------------
// release(): unconditional increment; CHECK(available_seats <= capacity)
// rejects an over-release with a StoreError
// -----------------------------------------------------------------------------
SeatLedger::Status SeatLedger::release(Transaction& tx,
                                       domain::EventId event_id) const {
  Connection& connection = tx.connection();
  connection
      .prepare(
          "UPDATE events SET available_seats = available_seats + 1 "
          "WHERE id = ?")
      .bind(1, event_id)
      .run();
  return connection.changes() == 1 ? Status::Ok : Status::NotFound;
}

// -----------------------------------------------------------------------------
// lockForUpdate(): no-op write to take the lock, then read under it
// -----------------------------------------------------------------------------
std::optional<domain::Event> SeatLedger::lockForUpdate(
    Transaction& tx, domain::EventId event_id) const {
  Connection& connection = tx.connection();
  connection
      .prepare(
          "UPDATE events SET available_seats = available_seats WHERE id = ?")
      .bind(1, event_id)
      .run();
  if (connection.changes() == 0) {
    return std::nullopt;
  }
  return readEvent(connection, event_id);
}

std::optional<domain::Event> SeatLedger::snapshot(
    Connection& connection, domain::EventId event_id) const {
  return readEvent(connection, event_id);
}

const char* ledgerStatusToString(SeatLedger::Status status) {
  switch (status) {
    case SeatLedger::Status::Ok:             return "OK";
    case SeatLedger::Status::SeatsExhausted: return "SEATS_EXHAUSTED";
    case SeatLedger::Status::NotFound:       return "NOT_FOUND";
  }
  return "UNKNOWN";
}

}  // namespace rsvp

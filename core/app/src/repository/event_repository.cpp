#include "rsvp/repository/event_repository.hpp"

namespace rsvp {

EventRepository::EventRepository(const ITimeProvider& time_provider)
    : time_provider_(time_provider) {}

// -----------------------------------------------------------------------------
// create(): available_seats starts equal to capacity
// -----------------------------------------------------------------------------
domain::Event EventRepository::create(Connection& connection,
                                      const std::string& title, int capacity,
                                      domain::UserId organizer_id) const {
  domain::Event event;
  event.title = title;
  event.capacity = capacity;
  event.available_seats = capacity;
  event.organizer_id = organizer_id;
  event.created_at_ms = time_provider_.now_ms();

  connection
      .prepare(
          "INSERT INTO events "
          "(title, capacity, available_seats, organizer_id, created_at_ms) "
          "VALUES (?, ?, ?, ?, ?)")
      .bind(1, event.title)
      .bind(2, static_cast<std::int64_t>(event.capacity))
      .bind(3, static_cast<std::int64_t>(event.available_seats))
      .bind(4, event.organizer_id)
      .bind(5, event.created_at_ms)
      .run();
  event.id = connection.lastInsertRowId();
  return event;
}

std::optional<domain::Event> EventRepository::find(Connection& connection,
                                                   domain::EventId id) const {
  Statement stmt = connection.prepare(
      "SELECT id, title, capacity, available_seats, organizer_id, "
      "created_at_ms FROM events WHERE id = ?");
  stmt.bind(1, id);
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

std::optional<domain::Event> EventRepository::updateTitle(
    Connection& connection, domain::EventId id,
    const std::string& title) const {
  connection.prepare("UPDATE events SET title = ? WHERE id = ?")
      .bind(1, title)
      .bind(2, id)
      .run();
  if (connection.changes() == 0) {
    return std::nullopt;
  }
  return find(connection, id);
}

bool EventRepository::remove(Connection& connection,
                             domain::EventId id) const {
  connection.prepare("DELETE FROM events WHERE id = ?").bind(1, id).run();
  return connection.changes() > 0;
}

}  // namespace rsvp

#include "rsvp/repository/registration_repository.hpp"

namespace rsvp {

namespace {

domain::Registration rowToRegistration(const Statement& stmt) {
  domain::Registration registration;
  registration.id = stmt.columnInt64(0);
  registration.user_id = stmt.columnInt64(1);
  registration.event_id = stmt.columnInt64(2);
  registration.created_at_ms = stmt.columnInt64(3);
  return registration;
}

}  // namespace

RegistrationRepository::RegistrationRepository(
    const ITimeProvider& time_provider)
    : time_provider_(time_provider) {}

std::optional<domain::Registration> RegistrationRepository::find(
    Connection& connection, domain::RegistrationId id) const {
  Statement stmt = connection.prepare(
      "SELECT id, user_id, event_id, created_at_ms FROM registrations "
      "WHERE id = ?");
  stmt.bind(1, id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return rowToRegistration(stmt);
}

std::optional<domain::Registration> RegistrationRepository::findByUserAndEvent(
    Connection& connection, domain::UserId user_id,
    domain::EventId event_id) const {
  Statement stmt = connection.prepare(
      "SELECT id, user_id, event_id, created_at_ms FROM registrations "
      "WHERE user_id = ? AND event_id = ?");
  stmt.bind(1, user_id).bind(2, event_id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return rowToRegistration(stmt);
}

// -----------------------------------------------------------------------------
// insertIfAbsent(): the UNIQUE(user_id, event_id) conflict becomes nullopt
// -----------------------------------------------------------------------------
std::optional<domain::Registration> RegistrationRepository::insertIfAbsent(
    Transaction& tx, domain::UserId user_id, domain::EventId event_id) const {
  Connection& connection = tx.connection();

  domain::Registration registration;
  registration.user_id = user_id;
  registration.event_id = event_id;
  registration.created_at_ms = time_provider_.now_ms();

  connection
      .prepare(
          "INSERT INTO registrations (user_id, event_id, created_at_ms) "
          "VALUES (?, ?, ?) ON CONFLICT(user_id, event_id) DO NOTHING")
      .bind(1, registration.user_id)
      .bind(2, registration.event_id)
      .bind(3, registration.created_at_ms)
      .run();

  if (connection.changes() == 0) {
    return std::nullopt;
  }
  registration.id = connection.lastInsertRowId();
  return registration;
}

bool RegistrationRepository::removeByUserAndEvent(
    Transaction& tx, domain::UserId user_id, domain::EventId event_id) const {
  Connection& connection = tx.connection();
  connection
      .prepare("DELETE FROM registrations WHERE user_id = ? AND event_id = ?")
      .bind(1, user_id)
      .bind(2, event_id)
      .run();
  return connection.changes() > 0;
}

int RegistrationRepository::countForEvent(Connection& connection,
                                          domain::EventId event_id) const {
  Statement stmt = connection.prepare(
      "SELECT COUNT(*) FROM registrations WHERE event_id = ?");
  stmt.bind(1, event_id);
  stmt.step();
  return stmt.columnInt(0);
}

}  // namespace rsvp

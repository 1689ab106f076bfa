#include "rsvp/store/schema.hpp"

namespace rsvp {

namespace {

// References to users keep the default NO ACTION: a blocked delete then
// fails with SQLITE_CONSTRAINT_FOREIGNKEY. ON DELETE RESTRICT would report
// SQLITE_CONSTRAINT_TRIGGER instead.
constexpr const char* kSchemaSql = R"sql(
CREATE TABLE IF NOT EXISTS users (
  id             INTEGER PRIMARY KEY AUTOINCREMENT,
  name           TEXT    NOT NULL,
  email          TEXT    NOT NULL UNIQUE,
  role           TEXT    NOT NULL DEFAULT 'attendee'
                         CHECK (role IN ('organizer', 'attendee')),
  created_at_ms  INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS events (
  id               INTEGER PRIMARY KEY AUTOINCREMENT,
  title            TEXT    NOT NULL,
  capacity         INTEGER NOT NULL CHECK (capacity > 0),
  available_seats  INTEGER NOT NULL
                   CHECK (available_seats >= 0 AND available_seats <= capacity),
  organizer_id     INTEGER NOT NULL REFERENCES users(id),
  created_at_ms    INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS registrations (
  id             INTEGER PRIMARY KEY AUTOINCREMENT,
  user_id        INTEGER NOT NULL REFERENCES users(id),
  event_id       INTEGER NOT NULL REFERENCES events(id) ON DELETE CASCADE,
  created_at_ms  INTEGER NOT NULL,
  UNIQUE (user_id, event_id)
);

CREATE INDEX IF NOT EXISTS idx_registrations_event
  ON registrations(event_id);
CREATE INDEX IF NOT EXISTS idx_events_organizer
  ON events(organizer_id);
)sql";

}  // namespace

void ensureSchema(Connection& connection) {
  connection.exec("PRAGMA journal_mode = WAL");
  connection.exec(kSchemaSql);
}

}  // namespace rsvp

#pragma once

#include "rsvp/store/connection.hpp"

namespace rsvp {

// -----------------------------------------------------------------------------
// ensureSchema(connection)
// -----------------------------------------------------------------------------
//
// @brief  Creates the users / events / registrations tables and their
//         indexes if they do not exist, and switches the database file to
//         WAL journal mode.
//
// @details
// Idempotent; called once at engine startup. Two rules the reservation
// protocol relies on live here, in the store itself:
//
//   events.available_seats  CHECK (available_seats >= 0 AND
//                                  available_seats <= capacity)
//   registrations           UNIQUE (user_id, event_id)
//
// WAL mode lets readers (user lookups, GET routes) proceed while a
// reservation transaction holds the write lock. It is a property of the
// database file, so setting it once covers every later connection.
//
// Throws StoreError on failure.
// -----------------------------------------------------------------------------
void ensureSchema(Connection& connection);

}  // namespace rsvp

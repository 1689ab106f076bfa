#pragma once

#include "rsvp/domain/event.hpp"
#include "rsvp/store/connection.hpp"
#include "rsvp/time/i_time_provider.hpp"

#include <optional>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// EventRepository
// -----------------------------------------------------------------------------
//
// @brief  CRUD on the events table, except the seat counter.
//
// @details
// create() is the only place available_seats is written outside SeatLedger:
// it is initialized to capacity. After that, capacity is immutable and
// available_seats moves only through SeatLedger::reserve()/release(), so
// this class exposes no way to change either of them. updateTitle() is the
// whole update surface.
//
// remove() cascades to the event's registrations (ON DELETE CASCADE); the
// seats disappear together with the ledger row, so the invariant
//   capacity - available_seats == live registrations
// holds trivially afterwards.
//
// Failures:
//   - create() with an unknown organizer throws a FOREIGN KEY StoreError.
//   - create() with capacity <= 0 or an empty title is rejected by the
//     caller; the schema CHECK is the backstop.
// -----------------------------------------------------------------------------
class EventRepository {
 public:
  explicit EventRepository(const ITimeProvider& time_provider);

  domain::Event create(Connection& connection, const std::string& title,
                       int capacity, domain::UserId organizer_id) const;

  std::optional<domain::Event> find(Connection& connection,
                                    domain::EventId id) const;

  std::optional<domain::Event> updateTitle(Connection& connection,
                                           domain::EventId id,
                                           const std::string& title) const;

  bool remove(Connection& connection, domain::EventId id) const;

 private:
  const ITimeProvider& time_provider_;
};

}  // namespace rsvp

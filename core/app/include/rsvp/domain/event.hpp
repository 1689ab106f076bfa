#pragma once

#include "rsvp/domain/user.hpp"

#include <cstdint>
#include <string>

namespace rsvp {
namespace domain {

using EventId = std::int64_t;

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Responsibility: Snapshot of one events row, which doubles as the event's
// seat ledger entry.
//
// @details
// capacity is fixed at creation. available_seats starts equal to capacity
// and afterwards moves only by +/-1 through SeatLedger::reserve() and
// SeatLedger::release(). The store enforces
//
//   0 <= available_seats <= capacity
//
// and the reservation protocol maintains
//
//   capacity - available_seats == number of registrations for the event.
//
// A snapshot is only authoritative inside the transaction that read it
// under SeatLedger::lockForUpdate(); copies held elsewhere are stale by
// definition and are used for responses only.
// -----------------------------------------------------------------------------
struct Event {
  EventId id{};
  std::string title;
  int capacity{0};
  int available_seats{0};
  UserId organizer_id{};
  std::int64_t created_at_ms{0};
};

}  // namespace domain
}  // namespace rsvp

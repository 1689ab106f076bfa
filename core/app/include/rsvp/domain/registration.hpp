#pragma once

#include "rsvp/domain/event.hpp"
#include "rsvp/domain/user.hpp"

#include <cstdint>

namespace rsvp {
namespace domain {

using RegistrationId = std::int64_t;

// -----------------------------------------------------------------------------
// Registration
// -----------------------------------------------------------------------------
// One live seat held by user_id at event_id. At most one exists per
// (user_id, event_id); the UNIQUE constraint on the registrations table
// enforces it. Created only by a successful reservation, removed only by a
// cancellation (or together with its event).
// -----------------------------------------------------------------------------
struct Registration {
  RegistrationId id{};
  UserId user_id{};
  EventId event_id{};
  std::int64_t created_at_ms{0};
};

}  // namespace domain
}  // namespace rsvp

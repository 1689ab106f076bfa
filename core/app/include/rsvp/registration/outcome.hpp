#pragma once

#include "rsvp/domain/registration.hpp"

#include <string>
#include <variant>

namespace rsvp {

// -----------------------------------------------------------------------------
// Registration outcomes
// -----------------------------------------------------------------------------
//
// Every call to RegistrationCoordinator returns exactly one of these
// structs inside a closed std::variant. Business rejections are values,
// not exceptions; callers dispatch with std::get_if or std::visit and the
// compiler flags any alternative they forget.
//
//   Registered         seat reserved and registration stored (committed).
//   AlreadyRegistered  a live registration for (user, event) already
//                      exists; nothing changed.
//   EventFull          no seat was available under the lock; nothing
//                      changed.
//   EventNotFound      no such event.
//   UserNotFound       no such user.
//   TransientFailure   the datastore failed (lock timeout, I/O, commit).
//                      The transaction was rolled back in full, so the
//                      whole operation may be retried.
//   Cancelled          registration removed and its seat released.
//   NotRegistered      cancel() found nothing to remove. Not an error.
// -----------------------------------------------------------------------------

struct Registered {
  domain::Registration registration;
};

struct AlreadyRegistered {};

struct EventFull {};

struct EventNotFound {};

struct UserNotFound {};

struct TransientFailure {
  std::string reason;
};

struct Cancelled {};

struct NotRegistered {};

using RegisterOutcome = std::variant<
    Registered,
    AlreadyRegistered,
    EventFull,
    EventNotFound,
    UserNotFound,
    TransientFailure>;

using CancelOutcome = std::variant<
    Cancelled,
    NotRegistered,
    TransientFailure>;

// Upper-case tag used in log lines ("REGISTERED", "EVENT_FULL", ...).
const char* outcomeName(const RegisterOutcome& outcome);
const char* outcomeName(const CancelOutcome& outcome);

}  // namespace rsvp

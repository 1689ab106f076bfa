#pragma once

#include "rsvp/ledger/seat_ledger.hpp"
#include "rsvp/registration/outcome.hpp"
#include "rsvp/repository/registration_repository.hpp"
#include "rsvp/repository/user_repository.hpp"
#include "rsvp/store/connection_pool.hpp"

namespace rsvp {

// -----------------------------------------------------------------------------
// RegistrationCoordinator: the seat-reservation transaction
// -----------------------------------------------------------------------------
//
// @brief  For one (user, event) pair, atomically validates, reserves a seat
//         and records the registration, or fails leaving state unchanged.
//
// @details
// registerUser() runs this sequence on a pooled connection:
//
//   1. users.exists(user)                  outside the transaction
//                                          -> UserNotFound
//   2. BEGIN IMMEDIATE                     takes the database write lock
//   3. registrations.findByUserAndEvent    -> AlreadyRegistered
//   4. ledger.lockForUpdate(event)         -> EventNotFound
//   5. locked row available_seats <= 0     -> EventFull
//   6. registrations.insertIfAbsent        conflict -> AlreadyRegistered
//                                          foreign key -> UserNotFound
//   7. ledger.reserve(event)               failure  -> EventFull (logged)
//   8. COMMIT                              -> Registered
//
// Every early return in 3-7 rolls the transaction back through the
// Transaction destructor, so no partial write survives. Step 6 catches the
// duplicate race that slips past step 3 (another connection committing the
// same pair); the UNIQUE constraint makes it impossible to store two
// registrations, and the seat is not charged. Step 7 cannot fail while the
// lock from step 2 is held; if it does, the ledger invariant is already
// broken and the attempt is rejected loudly instead of overbooking.
//
// A user deleted between 1 and 2 makes step 6 fail on the foreign key. That
// outcome is deterministic, so it is reported as UserNotFound.
//
// cancel() deletes the registration and releases its seat in one write
// transaction. The seat is released only when a row was actually deleted,
// so repeated cancels never inflate available_seats.
//
// Serialization: the SQLite write lock is the only synchronization point.
// There is no in-process mutex, so the protocol is equally correct with
// several server processes sharing the database file.
//
// Failures: any StoreError (lock wait beyond the busy timeout, I/O error,
// failed commit, any other constraint violation) is logged and returned
// as TransientFailure. Other exception types propagate.
//
// Thread model: Safe to call from any number of threads concurrently. Each
//               call leases its own Connection from the pool.
// Ownership:    Borrows the pool, ledger and repositories; all must
//               outlive the coordinator. RegistrationEngine owns them.
// -----------------------------------------------------------------------------
class RegistrationCoordinator {
 public:
  RegistrationCoordinator(ConnectionPool& pool, const SeatLedger& ledger,
                          const UserRepository& users,
                          const RegistrationRepository& registrations);

  RegistrationCoordinator(const RegistrationCoordinator&) = delete;
  RegistrationCoordinator& operator=(const RegistrationCoordinator&) = delete;

  RegisterOutcome registerUser(domain::UserId user_id,
                               domain::EventId event_id);

  CancelOutcome cancel(domain::UserId user_id, domain::EventId event_id);

 private:
  ConnectionPool& pool_;
  const SeatLedger& ledger_;
  const UserRepository& users_;
  const RegistrationRepository& registrations_;
};

}  // namespace rsvp

#include "rsvp/registration/registration_coordinator.hpp"
#include "rsvp/store/store_error.hpp"
#include "rsvp/store/transaction.hpp"

#include <iostream>
#include <optional>

namespace rsvp {

RegistrationCoordinator::RegistrationCoordinator(
    ConnectionPool& pool, const SeatLedger& ledger,
    const UserRepository& users, const RegistrationRepository& registrations)
    : pool_(pool),
      ledger_(ledger),
      users_(users),
      registrations_(registrations) {}

// -----------------------------------------------------------------------------
// registerUser()
// -----------------------------------------------------------------------------
RegisterOutcome RegistrationCoordinator::registerUser(
    domain::UserId user_id, domain::EventId event_id) {
  try {
    // Declared before the transaction so it is released after rollback.
    auto connection = pool_.acquire();

    if (!users_.exists(*connection, user_id)) {
      return UserNotFound{};
    }

    Transaction tx(*connection, Transaction::Mode::Immediate);

    if (registrations_.findByUserAndEvent(*connection, user_id, event_id)) {
      return AlreadyRegistered{};
    }

    auto event = ledger_.lockForUpdate(tx, event_id);
    if (!event) {
      return EventNotFound{};
    }
    if (event->available_seats <= 0) {
      return EventFull{};
    }

    std::optional<domain::Registration> registration;
    try {
      registration = registrations_.insertIfAbsent(tx, user_id, event_id);
    } catch (const StoreError& e) {
      // The user was deleted after the existence check.
      if (e.isForeignKeyViolation()) {
        return UserNotFound{};
      }
      throw;
    }
    if (!registration) {
      return AlreadyRegistered{};
    }

    SeatLedger::Status status = ledger_.reserve(tx, event_id);
    if (status != SeatLedger::Status::Ok) {
      std::cerr << "[RegistrationCoordinator] CRITICAL: reserve returned "
                << ledgerStatusToString(status) << " for event " << event_id
                << " after the locked row showed "
                << event->available_seats
                << " available seat(s). Ledger invariant violated; "
                   "rolling back.\n";
      return EventFull{};
    }

    tx.commit();
    return Registered{*registration};
  } catch (const StoreError& e) {
    std::cerr << "[RegistrationCoordinator] register user=" << user_id
              << " event=" << event_id << " failed: " << e.what() << "\n";
    return TransientFailure{e.what()};
  }
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
CancelOutcome RegistrationCoordinator::cancel(domain::UserId user_id,
                                              domain::EventId event_id) {
  try {
    auto connection = pool_.acquire();
    Transaction tx(*connection, Transaction::Mode::Immediate);

    if (!registrations_.removeByUserAndEvent(tx, user_id, event_id)) {
      return NotRegistered{};
    }

    // The registration row existed, so its event row does too (ON DELETE
    // CASCADE would have removed both).
    SeatLedger::Status status = ledger_.release(tx, event_id);
    if (status != SeatLedger::Status::Ok) {
      std::cerr << "[RegistrationCoordinator] CRITICAL: release returned "
                << ledgerStatusToString(status) << " for event " << event_id
                << " while a registration existed. Rolling back.\n";
      return TransientFailure{"seat release failed"};
    }

    tx.commit();
    return Cancelled{};
  } catch (const StoreError& e) {
    std::cerr << "[RegistrationCoordinator] cancel user=" << user_id
              << " event=" << event_id << " failed: " << e.what() << "\n";
    return TransientFailure{e.what()};
  }
}

}  // namespace rsvp

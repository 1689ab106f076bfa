#pragma once

#include "rsvp/domain/registration.hpp"
#include "rsvp/store/connection.hpp"
#include "rsvp/store/transaction.hpp"
#include "rsvp/time/i_time_provider.hpp"

#include <optional>

namespace rsvp {

// -----------------------------------------------------------------------------
// RegistrationRepository
// -----------------------------------------------------------------------------
//
// @brief  Access to the registrations table.
//
// @details
// The two writes take a Transaction, never a bare Connection: a
// registration row is only ever created or removed together with the
// matching SeatLedger reserve()/release() in the same transaction. The
// RegistrationCoordinator is their only caller.
//
// Thread model: Stateless apart from the borrowed clock.
// -----------------------------------------------------------------------------
class RegistrationRepository {
 public:
  explicit RegistrationRepository(const ITimeProvider& time_provider);

  std::optional<domain::Registration> find(Connection& connection,
                                           domain::RegistrationId id) const;

  std::optional<domain::Registration> findByUserAndEvent(
      Connection& connection, domain::UserId user_id,
      domain::EventId event_id) const;

  // ---------------------------------------------------------------------------
  // insertIfAbsent(tx, user_id, event_id)
  // ---------------------------------------------------------------------------
  // @brief  INSERT ... ON CONFLICT(user_id, event_id) DO NOTHING.
  //
  // @return The new Registration (id from the insert, timestamp from the
  //         clock), or std::nullopt when the UNIQUE constraint swallowed
  //         the insert because a registration for the pair already exists.
  //
  // @details
  // The conflict is an expected outcome of the duplicate race, not an
  // error, so it never surfaces as a StoreError and never aborts the
  // transaction. Other constraint failures (unknown user or event) still
  // throw.
  // ---------------------------------------------------------------------------
  std::optional<domain::Registration> insertIfAbsent(
      Transaction& tx, domain::UserId user_id, domain::EventId event_id) const;

  // True if a registration row was deleted.
  bool removeByUserAndEvent(Transaction& tx, domain::UserId user_id,
                            domain::EventId event_id) const;

  int countForEvent(Connection& connection, domain::EventId event_id) const;

 private:
  const ITimeProvider& time_provider_;
};

}  // namespace rsvp

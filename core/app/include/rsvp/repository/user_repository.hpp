#pragma once

#include "rsvp/domain/user.hpp"
#include "rsvp/store/connection.hpp"
#include "rsvp/time/i_time_provider.hpp"

#include <optional>
#include <string>

namespace rsvp {

// Fields accepted by UserRepository::update(). Unset fields keep their
// stored value.
struct UserUpdate {
  std::optional<std::string> name;
  std::optional<std::string> email;
  std::optional<domain::UserRole> role;
};

// -----------------------------------------------------------------------------
// UserRepository
// -----------------------------------------------------------------------------
// Responsibility: CRUD on the users table.
//
// Absent rows are reported as std::nullopt / false. Every other failure is
// a StoreError; in particular
//   - create()/update() with an email already in use throw a UNIQUE
//     constraint StoreError,
//   - remove() of a user who still organizes events or holds registrations
//     throws a FOREIGN KEY constraint StoreError.
//
// Input validation (non-empty name and email) belongs to the caller.
//
// Thread model: Stateless apart from the borrowed clock; share one instance.
//               Each call runs on the Connection it is handed.
// -----------------------------------------------------------------------------
class UserRepository {
 public:
  explicit UserRepository(const ITimeProvider& time_provider);

  domain::User create(Connection& connection, const std::string& name,
                      const std::string& email, domain::UserRole role) const;

  std::optional<domain::User> find(Connection& connection,
                                   domain::UserId id) const;

  bool exists(Connection& connection, domain::UserId id) const;

  // Applies `changes` atomically and returns the updated row, or
  // std::nullopt if the user does not exist.
  std::optional<domain::User> update(Connection& connection, domain::UserId id,
                                     const UserUpdate& changes) const;

  // True if a row was deleted.
  bool remove(Connection& connection, domain::UserId id) const;

 private:
  const ITimeProvider& time_provider_;
};

}  // namespace rsvp
